#include "UITheme.hpp"

void UITheme::pushSectionStyle()
{
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(12.0f, 10.0f));
    ImGui::PushStyleVar(ImGuiStyleVar_ChildRounding, 14.0f);
    ImGui::PushStyleColor(ImGuiCol_ChildBg, ImVec4(0.13f, 0.13f, 0.13f, 1.0f));
}

void UITheme::popSectionStyle()
{
    ImGui::PopStyleColor(1);
    ImGui::PopStyleVar(2);
}

void UITheme::pushProgressBarStyle()
{
    ImGui::PushStyleColor(ImGuiCol_PlotHistogram, accent_);
    ImGui::PushStyleColor(ImGuiCol_FrameBg, track_);
}

void UITheme::popProgressBarStyle()
{
    ImGui::PopStyleColor(2);
}

ImVec4 UITheme::statusColor(bool is_success, bool is_error, bool is_disabled)
{
    if (is_disabled)
        return disabled_;
    if (is_error)
        return error_;
    if (is_success)
        return success_;
    return warning_;
}

void UITheme::applyTheme()
{
    ImGuiStyle& s = ImGui::GetStyle();

    ImVec4 bg = ImVec4(0.09f, 0.09f, 0.09f, 1.0f);
    s.Colors[ImGuiCol_WindowBg] = bg;
    s.Colors[ImGuiCol_PopupBg] = ImVec4(bg.x, bg.y, bg.z, 0.97f);
    s.Colors[ImGuiCol_Border] = ImVec4(1.0f, 1.0f, 1.0f, 0.15f);

    // Orange accent derived from #ff7a00
    ImVec4 orange_base = ImVec4(0.80f, 0.38f, 0.0f, 1.0f);
    ImVec4 orange_hovered = ImVec4(0.92f, 0.44f, 0.0f, 1.0f);
    ImVec4 orange_active = accent_;
    ImVec4 frame = ImVec4(0.20f, 0.20f, 0.20f, 1.0f);
    ImVec4 frame_hovered = ImVec4(0.26f, 0.26f, 0.26f, 1.0f);
    ImVec4 frame_active = ImVec4(0.30f, 0.30f, 0.30f, 1.0f);

    s.Colors[ImGuiCol_Header] = orange_base;
    s.Colors[ImGuiCol_HeaderHovered] = orange_hovered;
    s.Colors[ImGuiCol_HeaderActive] = orange_active;

    s.Colors[ImGuiCol_FrameBg] = frame;
    s.Colors[ImGuiCol_FrameBgHovered] = frame_hovered;
    s.Colors[ImGuiCol_FrameBgActive] = frame_active;

    s.Colors[ImGuiCol_Button] = orange_base;
    s.Colors[ImGuiCol_ButtonHovered] = orange_hovered;
    s.Colors[ImGuiCol_ButtonActive] = orange_active;

    s.Colors[ImGuiCol_CheckMark] = accent_;
    s.Colors[ImGuiCol_PlotHistogram] = accent_;
    s.Colors[ImGuiCol_TextSelectedBg] = ImVec4(1.0f, 0.478f, 0.0f, 0.35f);
    s.Colors[ImGuiCol_ModalWindowDimBg] = ImVec4(0.0f, 0.0f, 0.0f, 0.6f);

    s.WindowRounding = 0.0f;
    s.ChildRounding = 14.0f;
    s.FrameRounding = 8.0f;
    s.PopupRounding = 10.0f;
    s.WindowBorderSize = 0.0f;
    s.FrameBorderSize = 0.0f;
    s.ScrollbarSize = 14.0f;
    s.GrabRounding = 8.0f;
    s.FramePadding = ImVec2(10.0f, 8.0f);
    s.ItemSpacing = ImVec2(10.0f, 8.0f);
}
