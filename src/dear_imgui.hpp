#pragma once

#include <concepts>
#include <string_view>

#include "imgui.h"

consteval ImU32 IM_COL32_GREY(ImU8 v, ImU8 alpha) { return IM_COL32(v, v, v, alpha); }

inline void imgui_Str(std::string_view str) { //
    ImGui::TextUnformatted(str.data(), str.data() + str.size());
}

inline void imgui_StrDisabled(std::string_view str) {
    ImGui::PushStyleColor(ImGuiCol_Text, ImGui::GetStyleColorVec4(ImGuiCol_TextDisabled));
    imgui_Str(str);
    ImGui::PopStyleColor();
}

// Wrapped at the same width as `HelpMarker` in "imgui_demo.cpp".
inline void imgui_ItemTooltip(const std::invocable<> auto& desc) {
    if (ImGui::IsItemHovered(ImGuiHoveredFlags_ForTooltip) && ImGui::BeginTooltip()) {
        ImGui::PushTextWrapPos(ImGui::GetFontSize() * 35.0f);
        desc();
        ImGui::PopTextWrapPos();
        ImGui::EndTooltip();
    }
}

inline void imgui_ItemTooltip(std::string_view desc) { //
    imgui_ItemTooltip([desc] { imgui_Str(desc); });
}

// `ImGui::End` is required whether or not `ImGui::Begin` returns true.
struct [[nodiscard]] imgui_Window {
    imgui_Window(const imgui_Window&) = delete;
    imgui_Window& operator=(const imgui_Window&) = delete;

    const bool visible;
    explicit imgui_Window(const char* name, ImGuiWindowFlags flags) : visible(ImGui::Begin(name, nullptr, flags)) {}
    ~imgui_Window() { ImGui::End(); }
    explicit operator bool() const { return visible; }
};
