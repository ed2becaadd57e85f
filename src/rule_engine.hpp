#pragma once

#include <cstdint>
#include <vector>

#include "grid.hpp"

namespace lifebound {

    // Live-neighbor counts for one generation, gathered only around live cells.
    struct neighbor_countsT {
        std::vector<vecT> live;
        std::vector<int> live_count; // live_count[i] ~ live[i].

        // Dead cells with at least one live neighbor. May lie (one cell) outside the surface.
        std::vector<vecT> candidates;
        std::vector<int> candidate_count; // candidate_count[i] ~ candidates[i].
    };

    // Reads `grid` only.
    inline neighbor_countsT count_neighbors(const gridT& grid) {
        const surfaceT& surface = grid.surface();

        neighbor_countsT counts;
        counts.live = grid.alive_cells();
        counts.live_count.assign(counts.live.size(), 0);

        // Counters for dead cells, covering the surface plus a one-cell ring around it.
        const int padded_w = surface.width() + 2;
        const auto padded_index = [padded_w](vecT cell) { return (cell.y + 1) * padded_w + (cell.x + 1); };
        std::vector<uint8_t> dead_count(padded_w * (surface.height() + 2), 0);

        for (size_t i = 0; i < counts.live.size(); ++i) {
            const vecT cell = counts.live[i];
            for (const vecT& offset : neighbor_offsets) {
                const vecT neighbor = cell + offset;
                if (surface.contains(neighbor) && grid.alive(neighbor)) {
                    ++counts.live_count[i];
                } else if (dead_count[padded_index(neighbor)]++ == 0) {
                    counts.candidates.push_back(neighbor);
                }
            }
        }

        counts.candidate_count.reserve(counts.candidates.size());
        for (const vecT& cell : counts.candidates) {
            counts.candidate_count.push_back(dead_count[padded_index(cell)]);
        }
        return counts;
    }

    // Apply B3/S23 to `grid`. Edges are hard boundaries: nothing is born outside the surface.
    [[nodiscard]] inline gridT advance(const gridT& grid) {
        const neighbor_countsT counts = count_neighbors(grid);

        gridT next(grid);
        for (size_t i = 0; i < counts.live.size(); ++i) {
            const int c = counts.live_count[i];
            if (c < 2 || c > 3) { // Underpopulation or overcrowding.
                next.set(counts.live[i], false);
            }
        }
        for (size_t i = 0; i < counts.candidates.size(); ++i) {
            if (counts.candidate_count[i] == 3 && is_in_surface(next.surface(), counts.candidates[i])) {
                next.set(counts.candidates[i], true);
            }
        }
        return next;
    }

    [[nodiscard]] inline gridT advance(const gridT& grid, int n) {
        assert(n >= 0);
        gridT next(grid);
        for (int i = 0; i < n; ++i) {
            next = advance(next);
        }
        return next;
    }

#ifdef ENABLE_TESTS
    namespace _tests {
        inline gridT make_grid(vecT size, std::initializer_list<vecT> cells) {
            const surfaceT surface{size};
            return load_pattern(surface, {0, 0}, {cells.begin(), cells.end()});
        }

        inline const testT test_count_single = [] {
            const neighbor_countsT counts = count_neighbors(make_grid({10, 10}, {{0, 0}}));
            assert(counts.live.size() == 1 && counts.live_count[0] == 0);
            assert(counts.candidates.size() == 8); // Including 5 cells outside the surface.
            assert(std::ranges::all_of(counts.candidate_count, [](int c) { return c == 1; }));
        };

        inline const testT test_count_block = [] {
            const neighbor_countsT counts = count_neighbors(make_grid({10, 10}, {{5, 5}, {6, 5}, {5, 6}, {6, 6}}));
            assert(std::ranges::all_of(counts.live_count, [](int c) { return c == 3; }));
            assert(counts.candidates.size() == 12);
            assert(std::ranges::none_of(counts.candidate_count, [](int c) { return c == 3; }));
        };

        inline const testT test_still_block = [] {
            const gridT block = make_grid({20, 20}, {{5, 5}, {6, 5}, {5, 6}, {6, 6}});
            assert(advance(block) == block);
        };

        inline const testT test_blinker = [] {
            const gridT horizontal = make_grid({20, 20}, {{4, 5}, {5, 5}, {6, 5}});
            const gridT vertical = make_grid({20, 20}, {{5, 4}, {5, 5}, {5, 6}});
            assert(advance(horizontal) == vertical);
            assert(advance(advance(horizontal)) == horizontal);
            assert(advance(vertical, 2) == vertical);
        };

        inline const testT test_underpopulation = [] {
            const gridT single = make_grid({20, 20}, {{10, 10}});
            const gridT next = advance(single);
            assert(next.population() == 0);
            assert(next.cardinality() == 20 * 20);
        };

        inline const testT test_edge_births = [] {
            // The candidates at x = -1 and x = 10 have exactly 3 live neighbors.
            assert((advance(make_grid({10, 10}, {{0, 4}, {0, 5}, {0, 6}})).alive_cells() ==
                    std::vector<vecT>{{0, 5}, {1, 5}}));
            assert((advance(make_grid({10, 10}, {{9, 4}, {9, 5}, {9, 6}})).alive_cells() ==
                    std::vector<vecT>{{8, 5}, {9, 5}}));
            assert((advance(make_grid({10, 10}, {{4, 0}, {5, 0}, {6, 0}})).alive_cells() ==
                    std::vector<vecT>{{5, 0}, {5, 1}}));
        };

        inline const testT test_deterministic = [] {
            const gridT grid = create_random(surfaceT{{.x = 40, .y = 30}}, 3, testT::rand);
            const gridT a = advance(grid);
            const gridT b = advance(grid);
            assert(a == b);
            assert(a.cardinality() == grid.cardinality());
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

} // namespace lifebound
