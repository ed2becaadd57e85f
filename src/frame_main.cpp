#include <SDL_log.h>

#include "common.hpp"
#include "simulation.hpp"

using lifebound::gridT;
using lifebound::simulationT;
using lifebound::surfaceT;
using lifebound::vecT;

// Well-known patterns bound to keys in the setup phase.
struct presetT {
    ImGuiKey key;
    const char* label;
    const char* filename;
    std::optional<vecT> anchor; // nullopt ~ centre of the surface.
};

static const presetT presets[]{
    {ImGuiKey_G, "Gosper glider gun", "gosperglidergun_106.lif", vecT{.x = 20, .y = 6}},
    {ImGuiKey_A, "Acorn", "acorn_106.lif", std::nullopt},
    {ImGuiKey_S, "Switch engine", "switchengine_106.lif", std::nullopt},
    {ImGuiKey_L, "Glider", "glider_106.lif", vecT{.x = 3, .y = 3}},
    {ImGuiKey_P, "R-pentomino", "rpentomino_106.lif", std::nullopt},
    {ImGuiKey_D, "Diehard", "diehard_106.lif", std::nullopt},
};

static const char* const setup_hint =
    " (set initial conditions [mouse|r|c|g|a|s|l|p|d] and press RETURN to start; or ESC to quit)";
static const char* const running_hint = " (press RETURN to re-set the start conditions or ESC to quit)";

// Generations while running are paced by this.
static tick_timer timer{configT::tick_rate};

static void start(simulationT& sim) {
    sim.start();
    timer.restart();
    SDL_Log("Start running with %d live cells.", sim.grid().population());
}

static void reset(simulationT& sim) {
    SDL_Log("Reset at generation %d.", sim.gen());
    sim.reset();
}

static void set_title(const simulationT& sim) {
    static std::string last{};
    std::string title = sim.phase() == simulationT::Setup
                            ? std::format("{}{}", configT::title, setup_hint)
                            : std::format("{}{} generation={}", configT::title, running_hint, sim.gen());
    if (title != last) {
        set_window_title(title);
        last.swap(title);
    }
}

static void load_preset(simulationT& sim, const presetT& preset) {
    const vecT anchor = preset.anchor.value_or(sim.surface().centre());
    if (auto grid = load_pattern_file(sim.surface(), anchor, preset.filename)) {
        sim.set_grid(std::move(*grid));
    }
}

// Returns false if the program should quit.
static bool handle_keys(simulationT& sim) {
    if (shortcuts::test(ImGuiKey_Escape)) {
        return false;
    }

    if (sim.phase() == simulationT::Setup) {
        if (shortcuts::test(ImGuiKey_Enter) || shortcuts::test(ImGuiKey_KeypadEnter)) {
            start(sim);
        } else if (shortcuts::test(ImGuiKey_R)) {
            sim.set_grid(lifebound::create_random(sim.surface(), configT::random_fraction, global_mt19937()));
        } else if (shortcuts::test(ImGuiKey_C)) {
            sim.set_grid(lifebound::create_empty(sim.surface()));
        } else {
            for (const presetT& preset : presets) {
                if (shortcuts::test(preset.key)) {
                    load_preset(sim, preset);
                    break;
                }
            }
        }
    } else {
        if (shortcuts::test(ImGuiKey_Enter) || shortcuts::test(ImGuiKey_KeypadEnter)) {
            reset(sim);
        } else if (shortcuts::test(ImGuiKey_Space)) {
            sim.pause() = !sim.pause();
        } else if (sim.pause() && shortcuts::test(ImGuiKey_N, true)) {
            sim.step();
        }
    }
    return true;
}

// The whole window shows the surface; clicking a cell toggles it in the setup phase.
static void canvas(simulationT& sim) {
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoSavedSettings |
                                   ImGuiWindowFlags_NoScrollWithMouse;
    const ImGuiViewport* viewport = ImGui::GetMainViewport();

    ImGui::SetNextWindowPos(viewport->Pos);
    ImGui::SetNextWindowSize(viewport->Size);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0, 0));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0);
    if (auto window = imgui_Window("Canvas", flags)) {
        const ImVec2 canvas_size = viewport->Size;
        ImGui::Image(make_screen(sim.grid()), canvas_size);

        const ImVec2 min = ImGui::GetItemRectMin();
        const vecT cells = sim.surface().size();
        const float cell_w = canvas_size.x / cells.x;
        const float cell_h = canvas_size.y / cells.y;

        ImDrawList* const drawlist = ImGui::GetWindowDrawList();
        for (int x = 0; x < cells.x; ++x) {
            drawlist->AddLine({min.x + x * cell_w, min.y}, {min.x + x * cell_w, min.y + canvas_size.y},
                              configT::grid_line_col);
        }
        for (int y = 0; y < cells.y; ++y) {
            drawlist->AddLine({min.x, min.y + y * cell_h}, {min.x + canvas_size.x, min.y + y * cell_h},
                              configT::grid_line_col);
        }

        if (sim.phase() == simulationT::Setup && ImGui::IsItemHovered() &&
            ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
            const ImVec2 mouse_pos = ImGui::GetMousePos();
            const vecT cell{.x = (int)floor((mouse_pos.x - min.x) / cell_w),
                            .y = (int)floor((mouse_pos.y - min.y) / cell_h)};
            if (!sim.toggle(cell)) {
                SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Ignored click outside the surface: (%d, %d)", cell.x,
                             cell.y);
            }
        }
    }
    ImGui::PopStyleVar(2);
}

static void status_panel(simulationT& sim) {
    ImGui::SetNextWindowPos({8, 8}, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowCollapsed(true, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowBgAlpha(0.85f);
    if (auto window = imgui_Window("Life", ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoSavedSettings)) {
        const surfaceT& surface = sim.surface();
        const char* const phase = sim.phase() == simulationT::Setup ? "setup"
                                  : sim.pause()                     ? "running (paused)"
                                                                    : "running";
        ImGui::Text("Phase: %s", phase);
        ImGui::Text("Surface: %d*%d", surface.width(), surface.height());
        ImGui::Text("Generation: %d", sim.gen());
        ImGui::Text("Population: %d", sim.grid().population());
        ImGui::Separator();

        if (sim.phase() == simulationT::Setup) {
            if (ImGui::Button("Start")) {
                start(sim);
                return;
            }
            imgui_ItemTooltip("Shortcut: 'Return'.");
            ImGui::SameLine();
            if (ImGui::Button("Random")) {
                sim.set_grid(lifebound::create_random(surface, configT::random_fraction, global_mt19937()));
            }
            imgui_ItemTooltip(std::format("1/{} of the cells. Shortcut: 'R'.", configT::random_fraction));
            ImGui::SameLine();
            if (ImGui::Button("Clear")) {
                sim.set_grid(lifebound::create_empty(surface));
            }
            imgui_ItemTooltip("Shortcut: 'C'.");
            ImGui::SameLine();
            imgui_StrDisabled("(?)");
            imgui_ItemTooltip("Click a cell to toggle it.");

            ImGui::SeparatorText("Presets");
            for (const presetT& preset : presets) {
                if (ImGui::Button(ImGui::GetKeyName(preset.key))) {
                    load_preset(sim, preset);
                }
                ImGui::SameLine(0, ImGui::GetStyle().ItemInnerSpacing.x);
                imgui_Str(preset.label);
            }

            ImGui::SeparatorText("Files");
            std::optional<gridT> loaded;
            select_pattern(surface, loaded);
            if (loaded) {
                sim.set_grid(std::move(*loaded));
            }
        } else {
            ImGui::Checkbox("Pause", &sim.pause());
            imgui_ItemTooltip("Shortcut: 'Space'.");
            ImGui::SameLine();
            ImGui::BeginDisabled(!sim.pause());
            if (ImGui::Button("+1")) {
                sim.step();
            }
            ImGui::EndDisabled();
            imgui_ItemTooltip("Advance one generation while paused. Shortcut: 'N' (repeatable).");
            ImGui::SameLine();
            if (ImGui::Button("Reset")) {
                reset(sim);
            }
            imgui_ItemTooltip("Back to setup. Shortcut: 'Return'.");
            ImGui::Text("(%d generations per second)", configT::tick_rate);
        }
    }
}

bool frame_main(const surfaceT& surface) {
    static simulationT sim(surface);
    assert(sim.surface() == surface);

    messenger::display();

    if (!handle_keys(sim)) {
        return false;
    }

    canvas(sim);
    status_panel(sim);
    set_title(sim);

    sim.end_frame(sim.phase() == simulationT::Running && !sim.pause() && timer.test());
    return true;
}
