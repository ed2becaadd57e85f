#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "grid.hpp"

namespace lifebound {

    // https://conwaylife.com/wiki/Life_1.06
    // Each line is either a comment (starting with '#'), blank, or "dx dy".

    enum class pattern_errorE { None, NotFound, TooLarge, ReadFailure, Malformed };

    struct patternT {
        pattern_errorE error = pattern_errorE::None;
        int line = 0; // 1-based; only for `Malformed`.
        std::vector<vecT> offsets{};

        bool ok() const { return error == pattern_errorE::None; }
    };

    // Files larger than this are rejected without being read.
    inline constexpr int max_pattern_size = 1024 * 256;

    [[nodiscard]] patternT parse_life_106(std::string_view text);

    [[nodiscard]] patternT read_pattern_file(const std::filesystem::path& path);

    // For error messages.
    std::string describe(const patternT& pattern);

} // namespace lifebound
