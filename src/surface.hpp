#pragma once

#include <array>
#include <cassert>
#include <cstdint>
#include <ctime>
#include <optional>
#include <random>

#ifndef NDEBUG
#define ENABLE_TESTS
#endif // !NDEBUG

namespace lifebound {

#ifdef ENABLE_TESTS
    namespace _tests {
        struct testT {
            inline static std::mt19937 rand{(uint32_t)time(0)};
            testT(const auto& fn) noexcept { fn(); }
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

    // A cell coordinate, or an offset between cells.
    struct vecT {
        int x, y;

        int xy() const { return x * y; }

        friend bool operator==(const vecT&, const vecT&) = default;
        friend vecT operator+(const vecT& a, const vecT& b) { return {.x = a.x + b.x, .y = a.y + b.y}; }
        friend vecT operator/(const vecT& a, int b) { return {.x = a.x / b, .y = a.y / b}; }

        bool both_gteq(const vecT& b) const { return x >= b.x && y >= b.y; } // >=
        bool both_lt(const vecT& b) const { return x < b.x && y < b.y; }     // <
    };

    // The Moore neighborhood, in row-major order.
    // clang-format off
    inline constexpr std::array<vecT, 8> neighbor_offsets{{
        {-1, -1}, {0, -1}, {1, -1},
        {-1,  0},          {1,  0},
        {-1,  1}, {0,  1}, {1,  1},
    }};
    // clang-format on

    // The bounded region [0, width) * [0, height) where cells live.
    // Everything outside is permanently dead.
    class surfaceT {
        vecT m_size;

    public:
        explicit surfaceT(vecT size) : m_size{size} { assert(size.x > 0 && size.y > 0); }

        int width() const { return m_size.x; }
        int height() const { return m_size.y; }
        vecT size() const { return m_size; }
        int area() const { return m_size.xy(); }
        vecT centre() const { return m_size / 2; }

        bool contains(vecT cell) const { return cell.both_gteq({0, 0}) && cell.both_lt(m_size); }

        // Row-major.
        int index_of(vecT cell) const {
            assert(contains(cell));
            return cell.y * m_size.x + cell.x;
        }
        vecT cell_of(int index) const {
            assert(index >= 0 && index < area());
            return {.x = index % m_size.x, .y = index / m_size.x};
        }

        friend bool operator==(const surfaceT&, const surfaceT&) = default;
    };

    inline bool is_in_surface(const surfaceT& surface, vecT cell) { return surface.contains(cell); }

    // The surface covered by a window of `window_size` pixels, divided into square cells of `cell_size` pixels.
    // Returns nullopt if either dimension is not an exact multiple of `cell_size`.
    inline std::optional<surfaceT> make_surface(const vecT window_size, const int cell_size) {
        if (cell_size <= 0 || window_size.x <= 0 || window_size.y <= 0) {
            return std::nullopt;
        }
        if (window_size.x % cell_size != 0 || window_size.y % cell_size != 0) {
            return std::nullopt;
        }
        return surfaceT{window_size / cell_size};
    }

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_make_surface = [] {
            const std::optional<surfaceT> s = make_surface({.x = 1020, .y = 560}, 10);
            assert(s && s->width() == 102 && s->height() == 56 && s->area() == 102 * 56);
            assert(s->centre() == (vecT{51, 28}));

            assert(!make_surface({.x = 1025, .y = 560}, 10));
            assert(!make_surface({.x = 1020, .y = 565}, 10));
            assert(!make_surface({.x = 1020, .y = 560}, 0));
        };

        inline const testT test_surface_bounds = [] {
            const surfaceT s{{.x = 7, .y = 5}};
            assert(is_in_surface(s, {0, 0}) && is_in_surface(s, {6, 4}));
            assert(!is_in_surface(s, {-1, 0}) && !is_in_surface(s, {7, 0}));
            assert(!is_in_surface(s, {0, -1}) && !is_in_surface(s, {0, 5}));
            for (int i = 0; i < s.area(); ++i) {
                assert(s.index_of(s.cell_of(i)) == i);
            }
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

} // namespace lifebound
