// The self tests in the headers run at static initialization; the ones here need files or
// longer runs.

#undef NDEBUG
#ifndef ENABLE_TESTS
#define ENABLE_TESTS
#endif

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <string>

#include "pattern.hpp"
#include "rule_engine.hpp"
#include "simulation.hpp"

using namespace lifebound;

namespace {
    using pathT = std::filesystem::path;

    std::set<std::pair<int, int>> as_set(const gridT& grid) {
        std::set<std::pair<int, int>> set;
        grid.for_each_alive([&](vecT cell) { set.emplace(cell.x, cell.y); });
        return set;
    }

    // Removed on destruction.
    class temp_file {
        pathT m_path;

    public:
        temp_file(const char* name, std::string_view content) {
            m_path = std::filesystem::temp_directory_path() / name;
            std::ofstream file(m_path, std::ios::binary | std::ios::trunc);
            file.write(content.data(), content.size());
            assert(file.good());
        }
        ~temp_file() {
            std::error_code ec{};
            std::filesystem::remove(m_path, ec);
        }
        const pathT& path() const { return m_path; }
    };

    const vecT glider[]{{1, 0}, {2, 1}, {0, 2}, {1, 2}, {2, 2}};

    void test_parse_life_106() {
        const patternT pattern = parse_life_106("#Life 1.06\n"
                                                "#D A comment.\n"
                                                "\n"
                                                "0 -1\n"
                                                "  +1 0  \n"
                                                "-1 1\n");
        assert(pattern.ok());
        assert(pattern.offsets == std::vector<vecT>({{0, -1}, {1, 0}, {-1, 1}}));

        // No header at all, CRLF line endings, no final newline.
        const patternT crlf = parse_life_106("3 4\r\n-5 6\r\n7 8");
        assert(crlf.ok());
        assert(crlf.offsets == std::vector<vecT>({{3, 4}, {-5, 6}, {7, 8}}));

        const patternT empty = parse_life_106("#Life 1.06\n");
        assert(empty.ok() && empty.offsets.empty());
    }

    void test_parse_malformed() {
        const patternT one_int = parse_life_106("#Life 1.06\n0 0\n1\n2 2\n");
        assert(one_int.error == pattern_errorE::Malformed && one_int.line == 3);
        assert(one_int.offsets.empty());

        const patternT trailing = parse_life_106("0 0\n1 2 3\n");
        assert(trailing.error == pattern_errorE::Malformed && trailing.line == 2);

        const patternT words = parse_life_106("\n\nx y\n");
        assert(words.error == pattern_errorE::Malformed && words.line == 3);

        assert(describe(words) == "Line 3: expected two integers \"dx dy\".");
    }

    void test_read_pattern_file() {
        const temp_file file("lifebound_test_glider.lif", "#Life 1.06\r\n1 0\r\n2 1\r\n0 2\r\n1 2\r\n2 2\r\n");
        const patternT pattern = read_pattern_file(file.path());
        assert(pattern.ok());
        assert(std::ranges::equal(pattern.offsets, glider));
        assert(describe(pattern) == "5 cells.");

        const patternT missing = read_pattern_file(file.path().parent_path() / "lifebound_test_missing.lif");
        assert(missing.error == pattern_errorE::NotFound);

        const temp_file large("lifebound_test_large.lif", std::string(max_pattern_size + 1, '#'));
        assert(read_pattern_file(large.path()).error == pattern_errorE::TooLarge);

        // Offsets are only limited by `int`; the ones far outside the surface are dropped on loading.
        const temp_file far("lifebound_test_far.lif",
                            "#Life 1.06\n2147483647 0\n-2147483648 -2147483648\n0 2147483647\n0 0\n");
        const patternT far_pattern = read_pattern_file(far.path());
        assert(far_pattern.ok() && far_pattern.offsets.size() == 4);
        const surfaceT surface{{.x = 102, .y = 56}};
        int clipped = -1;
        const gridT grid = load_pattern(surface, surface.centre(), far_pattern.offsets, &clipped);
        assert(clipped == 3);
        assert((grid.alive_cells() == std::vector<vecT>{surface.centre()}));

        // A pattern filling the whole surface stays below the size limit.
        std::string full = "#Life 1.06\n";
        for (int y = 0; y < surface.height(); ++y) {
            for (int x = 0; x < surface.width(); ++x) {
                full += std::format("{} {}\n", x - surface.centre().x, y - surface.centre().y);
            }
        }
        assert(full.size() < size_t(max_pattern_size));
        const temp_file full_file("lifebound_test_full.lif", full);
        const patternT full_pattern = read_pattern_file(full_file.path());
        assert(full_pattern.ok());
        const gridT full_grid = load_pattern(surface, surface.centre(), full_pattern.offsets, &clipped);
        assert(clipped == 0 && full_grid.population() == surface.area());

        // A directory is not a readable pattern file.
        assert(read_pattern_file(file.path().parent_path()).error == pattern_errorE::ReadFailure);
    }

    void test_shipped_patterns() {
#ifdef LIFEBOUND_PATTERN_DIR
        const pathT dir = LIFEBOUND_PATTERN_DIR;
        const std::pair<const char*, int> expected[]{
            {"glider_106.lif", 5},     {"acorn_106.lif", 7},        {"rpentomino_106.lif", 5},
            {"diehard_106.lif", 7},    {"switchengine_106.lif", 8}, {"gosperglidergun_106.lif", 36},
        };
        for (const auto& [name, count] : expected) {
            const patternT pattern = read_pattern_file(dir / name);
            assert(pattern.ok() && int(pattern.offsets.size()) == count);
        }

        // Diehard vanishes after 130 generations, if it is not disturbed by the border.
        const surfaceT surface{{.x = 102, .y = 56}};
        const gridT diehard = load_pattern(surface, surface.centre(), read_pattern_file(dir / "diehard_106.lif").offsets);
        assert(advance(diehard, 129).population() != 0);
        assert(advance(diehard, 130).population() == 0);

        // The gun emits one glider every 30 generations.
        const gridT gun = load_pattern(surface, {.x = 20, .y = 6},
                                       read_pattern_file(dir / "gosperglidergun_106.lif").offsets);
        assert(advance(gun, 30).population() == 36 + 5);
#endif // LIFEBOUND_PATTERN_DIR
    }

    void test_glider_translation() {
        const surfaceT surface{{.x = 20, .y = 20}};
        const gridT start = load_pattern(surface, {.x = 5, .y = 5}, glider);
        const gridT moved = load_pattern(surface, {.x = 6, .y = 6}, glider);
        assert(advance(start, 4) == moved);
        assert(advance(start, 8) == load_pattern(surface, {.x = 7, .y = 7}, glider));
    }

    // Cells at the border have no neighbors beyond it; a glider becomes a block in the corner.
    void test_glider_into_corner() {
        const surfaceT surface{{.x = 10, .y = 10}};
        const gridT start = load_pattern(surface, {.x = 5, .y = 5}, glider);

        assert((as_set(advance(start, 4)) == std::set<std::pair<int, int>>({{6, 8}, {7, 6}, {7, 8}, {8, 7}, {8, 8}})));

        const std::set<std::pair<int, int>> block{{8, 8}, {8, 9}, {9, 8}, {9, 9}};
        gridT grid = advance(start, 12);
        assert(as_set(grid) == block);
        for (int i = 0; i < 20; ++i) {
            grid = advance(grid);
            assert(as_set(grid) == block);
            assert(grid.cardinality() == 100);
        }
    }

    void test_random_grid() {
        std::mt19937 rand{12345};
        const surfaceT surface{{.x = 102, .y = 56}};
        for (int i = 0; i < 20; ++i) {
            const gridT grid = create_random(surface, 8, rand);
            assert(grid.cardinality() == 102 * 56);
            assert(grid.population() == 102 * 56 / 8);

            const std::vector<vecT> cells = grid.alive_cells();
            assert(as_set(grid).size() == cells.size());
            for (const vecT& cell : cells) {
                assert(is_in_surface(surface, cell));
            }
        }

        // Every fraction from 1 (all alive) upwards.
        const surfaceT small{{.x = 7, .y = 3}};
        for (int fraction = 1; fraction <= 30; ++fraction) {
            assert(create_random(small, fraction, rand).population() == 21 / fraction);
        }
    }

    void test_methuselah_stays_in_surface() {
        const surfaceT surface{{.x = 40, .y = 30}};
        const vecT rpentomino[]{{0, -1}, {1, -1}, {-1, 0}, {0, 0}, {0, 1}};
        gridT grid = load_pattern(surface, surface.centre(), rpentomino);
        for (int i = 0; i < 300; ++i) {
            gridT next = advance(grid);
            assert(next.cardinality() == surface.area());
            assert(next == advance(grid)); // Deterministic.
            grid = std::move(next);
        }
    }

} // namespace

int main() {
    const std::pair<const char*, void (*)()> tests[]{
        {"parse_life_106", test_parse_life_106},
        {"parse_malformed", test_parse_malformed},
        {"read_pattern_file", test_read_pattern_file},
        {"shipped_patterns", test_shipped_patterns},
        {"glider_translation", test_glider_translation},
        {"glider_into_corner", test_glider_into_corner},
        {"random_grid", test_random_grid},
        {"methuselah_stays_in_surface", test_methuselah_stays_in_surface},
    };
    for (const auto& [name, fn] : tests) {
        fn();
        std::printf("passed: %s\n", name);
    }
    return 0;
}
