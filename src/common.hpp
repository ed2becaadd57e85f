#pragma once

#include <chrono>
#include <cmath>
#include <filesystem>
#include <format>
#include <optional>
#include <string>

#include "pattern.hpp"
#include "rule_engine.hpp"

#include "dear_imgui.hpp"

/* Not inline */ static const bool check_version = IMGUI_CHECKVERSION();

struct no_create {
    no_create() = delete;
};

inline std::mt19937& global_mt19937() {
    static std::mt19937 rand{(uint32_t)time(0)};
    return rand;
}

// Fixed for the whole run.
struct configT : no_create {
    static constexpr const char* title = "Game of Life";

    static constexpr lifebound::vecT window_size{.x = 1020, .y = 560}; // Pixels.
    static constexpr int cell_size = 10;                                // Pixels.

    // 1/random_fraction of the cells are alive after random seeding.
    static constexpr int random_fraction = 8;

    static constexpr int tick_rate = 10; // Generations per second.
    static constexpr int max_fps = 100;

    static constexpr ImU32 background_col = IM_COL32_BLACK;
    static constexpr ImU32 live_cell_col = IM_COL32(255, 0, 0, 255);
    static constexpr ImU32 grid_line_col = IM_COL32_GREY(40, 255);
};

// Managed by `main`.
bool set_pattern_dir(const char* u8path = nullptr); // nullptr ~ filesystem::current_path.
void set_window_title(const std::string& title);
bool frame_main(const lifebound::surfaceT& surface); // false ~ quit.

// The texture is only valid for the current frame.
[[nodiscard]] ImTextureID make_screen(const lifebound::gridT& grid);

// Managed by `frame_main`.
std::optional<lifebound::gridT> load_pattern_file(const lifebound::surfaceT& surface, lifebound::vecT anchor,
                                                  const std::filesystem::path& filename);
void select_pattern(const lifebound::surfaceT& surface, std::optional<lifebound::gridT>& out);

class shortcuts : no_create {
public:
    static bool keys_avail() { //
        return !ImGui::GetIO().WantCaptureKeyboard && !ImGui::IsAnyItemActive();
    }

    static bool test(ImGuiKey key, bool repeat = false) { //
        return keys_avail() && ImGui::IsKeyPressed(key, repeat);
    }
};

// A single line of text shown over everything else for a short while.
class messenger : no_create {
    using clockT = std::chrono::steady_clock;

    inline static std::string m_str{};
    inline static clockT::time_point m_until{};

public:
    static void set_msg(std::string str) {
        m_str = std::move(str);
        m_until = clockT::now() + std::chrono::milliseconds(2500);
    }

    template <class... U>
    static void set_msg(std::format_string<const U&...> fmt, const U&... args) {
        set_msg(std::format(fmt, args...));
    }

    // Managed by `frame_main`.
    static void display() {
        if (m_str.empty()) {
            return;
        } else if (clockT::now() > m_until) {
            m_str.clear();
            return;
        }

        const char *const text_beg = m_str.c_str(), *const text_end = m_str.c_str() + m_str.size();
        const ImVec2 padding = ImGui::GetStyle().WindowPadding;
        const ImVec2 text_size = ImGui::CalcTextSize(text_beg, text_end);
        const ImVec2 main_size = ImGui::GetMainViewport()->Size;
        const ImVec2 window_min(floor((main_size.x - text_size.x) / 2 - padding.x), padding.y);
        const ImVec2 window_max(window_min.x + text_size.x + padding.x * 2, window_min.y + text_size.y + padding.y * 2);

        ImDrawList* const drawlist = ImGui::GetForegroundDrawList();
        drawlist->AddRectFilled(window_min, window_max, ImGui::GetColorU32(ImGuiCol_PopupBg));
        drawlist->AddRect(window_min, window_max, ImGui::GetColorU32(ImGuiCol_Border));
        drawlist->AddText(ImVec2(window_min.x + padding.x, window_min.y + padding.y),
                          ImGui::GetColorU32(ImGuiCol_Text), text_beg, text_end);
    }
};

// Fires at most once every `1000 / rate` ms.
class tick_timer {
    using clockT = std::chrono::steady_clock;

    clockT::duration m_interval;
    clockT::time_point m_last{};

public:
    explicit tick_timer(int rate) : m_interval{std::chrono::milliseconds(1000 / rate)} { assert(rate > 0); }

    bool test() {
        const clockT::time_point now = clockT::now();
        if (m_last + m_interval <= now) {
            m_last = now;
            return true;
        }
        return false;
    }

    void restart() { m_last = clockT::now(); }
};
