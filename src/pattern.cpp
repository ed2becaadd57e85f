#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>

#include "pattern.hpp"

namespace lifebound {

    static bool is_blank(char ch) { return ch == ' ' || ch == '\t' || ch == '\r'; }

    static void skip_blank(const char*& str, const char* end) {
        while (str != end && is_blank(*str)) {
            ++str;
        }
    }

    // (`from_chars` does not take the leading '+'.)
    static bool take_int(const char*& str, const char* end, int& v) {
        if (str != end && *str == '+' && str + 1 != end && *(str + 1) != '-') {
            ++str;
        }
        const auto [ptr, ec] = std::from_chars(str, end, v);
        if (ec != std::errc{}) {
            return false;
        }
        str = ptr;
        return true;
    }

    static bool parse_line(std::string_view line, vecT& offset) {
        const char *str = line.data(), *const end = line.data() + line.size();
        skip_blank(str, end);
        if (!take_int(str, end, offset.x) || str == end || !is_blank(*str)) {
            return false;
        }
        skip_blank(str, end);
        if (!take_int(str, end, offset.y)) {
            return false;
        }
        skip_blank(str, end);
        return str == end;
    }

    patternT parse_life_106(std::string_view text) {
        patternT pattern{};
        for (int line_no = 1; !text.empty(); ++line_no) {
            std::string_view line = text;
            if (const auto find_nl = text.find('\n'); find_nl != text.npos) {
                line = text.substr(0, find_nl);
                text.remove_prefix(find_nl + 1);
            } else {
                text = {};
            }

            if (line.starts_with('#') || std::ranges::all_of(line, is_blank)) {
                continue;
            }

            vecT offset{};
            if (!parse_line(line, offset)) {
                // All-or-nothing.
                return {.error = pattern_errorE::Malformed, .line = line_no};
            }
            pattern.offsets.push_back(offset);
        }
        return pattern;
    }

    patternT read_pattern_file(const std::filesystem::path& path) {
        std::error_code ec{};
        const auto status = std::filesystem::status(path, ec);
        if (status.type() == std::filesystem::file_type::not_found) {
            return {.error = pattern_errorE::NotFound};
        } else if (ec || !std::filesystem::is_regular_file(status)) {
            return {.error = pattern_errorE::ReadFailure};
        }

        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return {.error = pattern_errorE::ReadFailure};
        } else if (size > max_pattern_size) {
            return {.error = pattern_errorE::TooLarge};
        }

        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file) {
            return {.error = pattern_errorE::ReadFailure};
        }
        std::string data(size, '\0');
        file.read(data.data(), size);
        if (file.gcount() != std::streamsize(size)) {
            return {.error = pattern_errorE::ReadFailure};
        }
        return parse_life_106(data);
    }

    std::string describe(const patternT& pattern) {
        switch (pattern.error) {
            case pattern_errorE::None: return std::format("{} cells.", pattern.offsets.size());
            case pattern_errorE::NotFound: return "File not found.";
            case pattern_errorE::TooLarge: return std::format("File too large (> {}KB).", max_pattern_size / 1024);
            case pattern_errorE::ReadFailure: return "Failed to read file.";
            case pattern_errorE::Malformed:
                return std::format("Line {}: expected two integers \"dx dy\".", pattern.line);
        }
        return {};
    }

} // namespace lifebound
