#include <algorithm>
#include <vector>

#include <SDL_log.h>

#include "common.hpp"

using pathT = std::filesystem::path;

static std::string cpp17_u8string(const pathT& path) {
    const auto u8string = path.u8string();
    return std::string(u8string.begin(), u8string.end());
}

static pathT cpp17_u8path(const std::string_view path) { //
    return pathT(std::u8string(path.begin(), path.end()));
}

// Canonical path of the "patterns" folder; empty() ~ not found.
static pathT pattern_dir{};

bool set_pattern_dir(const char* u8path) {
    auto try_set = [](const char* u8path) {
        std::error_code ec{};
        const pathT base = u8path ? cpp17_u8path(u8path) : std::filesystem::current_path(ec);
        if (!ec) {
            pathT p = std::filesystem::canonical(base / "patterns", ec);
            if (!ec && std::filesystem::is_directory(p, ec)) {
                pattern_dir.swap(p);
                SDL_Log("Pattern folder: %s", cpp17_u8string(pattern_dir).c_str());
                return true;
            }
        }
        return false;
    };

    return (u8path && try_set(u8path)) || try_set(nullptr);
}

std::optional<lifebound::gridT> load_pattern_file(const lifebound::surfaceT& surface, const lifebound::vecT anchor,
                                                  const pathT& filename) {
    const pathT path = pattern_dir / filename;
    const lifebound::patternT pattern = lifebound::read_pattern_file(path);
    if (!pattern.ok()) {
        const std::string what = lifebound::describe(pattern);
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot load %s: %s", cpp17_u8string(path).c_str(), what.c_str());
        messenger::set_msg("Cannot load {}:\n{}", cpp17_u8string(filename), what);
        return std::nullopt;
    }

    int clipped = 0;
    lifebound::gridT grid = lifebound::load_pattern(surface, anchor, pattern.offsets, &clipped);
    if (clipped != 0) {
        // (Those cells are not part of the surface and are dropped.)
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s: %d of %d cells are outside the surface.",
                    cpp17_u8string(filename).c_str(), clipped, int(pattern.offsets.size()));
        messenger::set_msg("{}: {} cells outside the surface were ignored.", cpp17_u8string(filename), clipped);
    }
    return grid;
}

// List of "*.lif" files in the pattern folder.
class pattern_list {
    char buf_filter[20]{};
    std::vector<pathT> m_files{}; // Filenames only.
    bool m_listed = false;

    void collect() {
        m_listed = true;
        m_files.clear();
        if (pattern_dir.empty()) {
            return;
        }
        try {
            for (const auto& entry : std::filesystem::directory_iterator(
                     pattern_dir, std::filesystem::directory_options::skip_permission_denied)) {
                if (entry.is_regular_file() && entry.path().extension() == ".lif") {
                    m_files.push_back(entry.path().filename());
                }
            }
            std::ranges::sort(m_files);
        } catch (const std::exception& err) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot list pattern folder: %s", err.what());
            messenger::set_msg("Cannot open folder:\n{}", cpp17_u8string(pattern_dir));
            m_files.clear();
        }
    }

public:
    void select(const lifebound::surfaceT& surface, std::optional<lifebound::gridT>& out) {
        if (!m_listed) {
            collect();
        }

        if (pattern_dir.empty()) {
            imgui_StrDisabled("(No pattern folder.)");
            return;
        }

        if (ImGui::SmallButton("Refresh")) {
            collect();
        }
        ImGui::SameLine();
        ImGui::SetNextItemWidth(120);
        ImGui::InputTextWithHint("##Filter", "Filter", buf_filter, std::size(buf_filter));

        if (ImGui::BeginChild("Files", {0, 120}, ImGuiChildFlags_Borders)) {
            bool has = false;
            for (const pathT& file : m_files) {
                const std::string str = cpp17_u8string(file);
                if (str.find(buf_filter) != str.npos) {
                    has = true;
                    if (ImGui::Selectable(str.c_str())) {
                        if (auto grid = load_pattern_file(surface, surface.centre(), file)) {
                            out.emplace(std::move(*grid));
                        }
                    }
                }
            }
            if (!has) {
                imgui_StrDisabled("None");
            }
        }
        ImGui::EndChild();
        imgui_ItemTooltip("Click to load at the centre of the surface.");
    }
};

void select_pattern(const lifebound::surfaceT& surface, std::optional<lifebound::gridT>& out) {
    static pattern_list list;
    list.select(surface, out);
}
