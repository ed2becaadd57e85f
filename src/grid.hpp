#pragma once

#include <algorithm>
#include <climits>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "surface.hpp"

namespace lifebound {

    // Alive/dead state for every cell in a surface.
    // There is always exactly `surface.area()` entries; cells outside the surface are not representable.
    class gridT {
        surfaceT m_surface;
        bool* m_data; // [x]*y; nullptr only after being moved from.

    public:
        explicit gridT(const surfaceT& surface) : m_surface{surface}, m_data{new bool[surface.area()]{}} {}

        ~gridT() { delete[] m_data; }

        gridT(const gridT& other) : m_surface{other.m_surface}, m_data{} {
            assert(!other.empty());
            m_data = new bool[m_surface.area()];
            std::copy_n(other.m_data, m_surface.area(), m_data);
        }
        gridT& operator=(const gridT&) = delete; // -> `= gridT(other)`

        gridT(gridT&& other) noexcept : m_surface{other.m_surface}, m_data{std::exchange(other.m_data, nullptr)} {}
        gridT& operator=(gridT&& other) noexcept {
            swap(other);
            return *this;
        }

        void swap(gridT& other) noexcept {
            std::swap(m_surface, other.m_surface);
            std::swap(m_data, other.m_data);
        }

        bool empty() const { return m_data == nullptr; }

        const surfaceT& surface() const { return m_surface; }

        // Number of entries; always the area of the surface.
        int cardinality() const {
            assert(!empty());
            return m_surface.area();
        }

        // (`cell` must be in the surface.)
        bool alive(vecT cell) const { return m_data[m_surface.index_of(cell)]; }
        void set(vecT cell, bool v) { m_data[m_surface.index_of(cell)] = v; }

        // nullopt ~ out of bounds.
        std::optional<bool> lookup(vecT cell) const {
            if (!m_surface.contains(cell)) {
                return std::nullopt;
            }
            return alive(cell);
        }

        // Returns false (and does nothing) if `cell` is out of bounds.
        [[nodiscard]] bool toggle(vecT cell) {
            if (!m_surface.contains(cell)) {
                return false;
            }
            bool& b = m_data[m_surface.index_of(cell)];
            b = !b;
            return true;
        }

        int population() const {
            assert(!empty());
            return int(std::ranges::count(data(), true));
        }

        // Row-major.
        std::span<const bool> data() const {
            assert(!empty());
            return {m_data, size_t(m_surface.area())};
        }

        void for_each_alive(const auto& fn) const {
            static_assert(requires { fn(vecT{}); });
            assert(!empty());
            const int width = m_surface.width();
            const bool* data = m_data;
            for (int y = 0; y < m_surface.height(); ++y, data += width) {
                for (int x = 0; x < width; ++x) {
                    if (data[x]) {
                        fn(vecT{.x = x, .y = y});
                    }
                }
            }
        }

        std::vector<vecT> alive_cells() const {
            std::vector<vecT> cells;
            for_each_alive([&cells](vecT cell) { cells.push_back(cell); });
            return cells;
        }

        friend bool operator==(const gridT& a, const gridT& b) {
            if (a.m_surface != b.m_surface) {
                return false;
            } else if (a.empty() || b.empty()) {
                return a.empty() && b.empty();
            } else {
                return std::equal(a.m_data, a.m_data + a.m_surface.area(), b.m_data);
            }
        }
    };

    inline gridT create_empty(const surfaceT& surface) { return gridT(surface); }

    // Exactly `area / fraction` (rounded down) distinct cells are chosen, uniformly without replacement.
    inline gridT create_random(const surfaceT& surface, const int fraction, std::mt19937& rand) {
        assert(fraction >= 1);
        gridT grid(surface);
        const int target = fraction >= 1 ? surface.area() / fraction : 0;

        // The grid itself is the set of chosen cells; a cell drawn twice is redrawn.
        std::uniform_int_distribution<int> dist_x(0, surface.width() - 1);
        std::uniform_int_distribution<int> dist_y(0, surface.height() - 1);
        for (int chosen = 0; chosen < target;) {
            const vecT cell{.x = dist_x(rand), .y = dist_y(rand)};
            if (!grid.alive(cell)) {
                grid.set(cell, true);
                ++chosen;
            }
        }
        return grid;
    }

    // Cells at `anchor + offset` are brought to life.
    // Offsets landing outside the surface are dropped; their number is written to `clipped` if provided.
    inline gridT load_pattern(const surfaceT& surface, const vecT anchor, std::span<const vecT> offsets,
                              int* clipped = nullptr) {
        gridT grid(surface);
        int dropped = 0;
        for (const vecT& offset : offsets) {
            // (`anchor + offset` may not fit in `int` for offsets from a file.)
            const int64_t x = int64_t(anchor.x) + offset.x, y = int64_t(anchor.y) + offset.y;
            if (x >= 0 && x < surface.width() && y >= 0 && y < surface.height()) {
                grid.set({.x = int(x), .y = int(y)}, true);
            } else {
                ++dropped;
            }
        }
        if (clipped) {
            *clipped = dropped;
        }
        return grid;
    }

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_create_empty = [] {
            const surfaceT surface{{.x = 13, .y = 9}};
            const gridT grid = create_empty(surface);
            assert(grid.cardinality() == 13 * 9);
            assert(grid.population() == 0);
            assert(std::ranges::none_of(grid.data(), [](bool b) { return b; }));
        };

        inline const testT test_create_random = [] {
            const surfaceT surface{{.x = 102, .y = 56}};
            for (const int fraction : {1, 2, 8, 100, surface.area(), surface.area() + 1}) {
                const gridT grid = create_random(surface, fraction, testT::rand);
                assert(grid.cardinality() == surface.area());
                assert(grid.population() == surface.area() / fraction);
            }
        };

        inline const testT test_toggle = [] {
            const surfaceT surface{{.x = 10, .y = 10}};
            gridT grid = create_empty(surface);
            assert(grid.toggle({3, 4}));
            assert(grid.lookup({3, 4}) == true);
            assert(grid.population() == 1);
            assert(grid.toggle({3, 4}));
            assert(grid == create_empty(surface));

            for (const vecT outside : {vecT{-1, 0}, vecT{0, -1}, vecT{10, 0}, vecT{0, 10}}) {
                assert(!grid.toggle(outside));
                assert(!grid.lookup(outside).has_value());
            }
            assert(grid.cardinality() == 100 && grid.population() == 0);
        };

        inline const testT test_load_pattern = [] {
            const surfaceT surface{{.x = 10, .y = 10}};
            const vecT offsets[]{{0, 0}, {-1, 0}, {1, 1}, {-5, 0}, {0, 6}};
            int clipped = -1;
            const gridT grid = load_pattern(surface, {4, 4}, offsets, &clipped);
            assert(clipped == 2); // (-1, 4) and (4, 10).
            assert(grid.cardinality() == 100);
            assert((grid.alive_cells() == std::vector<vecT>{{3, 4}, {4, 4}, {5, 5}}));

            // The anchor alone decides the placement.
            const vecT glider[]{{1, 0}, {2, 1}, {0, 2}, {1, 2}, {2, 2}};
            const gridT a = load_pattern(surface, {0, 0}, glider);
            const gridT b = load_pattern(surface, {1, 1}, glider);
            assert(a.population() == 5 && b.population() == 5);
            a.for_each_alive([&b](vecT cell) { assert(b.alive(cell + vecT{1, 1})); });

            // Offsets at the limits of `int` are dropped like any other outside cell.
            const vecT extremes[]{{INT_MAX, 0}, {INT_MIN, 0}, {0, INT_MAX}, {0, INT_MIN},
                                  {INT_MAX, INT_MAX}, {INT_MIN, INT_MIN}, {0, 0}};
            for (const vecT anchor : {vecT{0, 0}, vecT{5, 5}, vecT{9, 9}}) {
                clipped = -1;
                const gridT g = load_pattern(surface, anchor, extremes, &clipped);
                assert(clipped == 6);
                assert((g.alive_cells() == std::vector<vecT>{anchor}));
            }
        };

        inline const testT test_move = [] {
            const surfaceT surface{{.x = 4, .y = 4}};
            gridT a = create_empty(surface);
            assert(a.toggle({1, 1}));
            const gridT b(a);
            gridT c = std::move(a);
            assert(a.empty() && !c.empty());
            assert(b == c);
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

} // namespace lifebound
