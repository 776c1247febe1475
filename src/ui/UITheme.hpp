#pragma once

#include <imgui.h>

class UITheme
{
public:
    static const ImVec4& accentColor() { return accent_; }
    static const ImVec4& trackColor() { return track_; }
    static const ImVec4& mutedTextColor() { return muted_text_; }
    static const ImVec4& warningColor() { return warning_; }
    static const ImVec4& successColor() { return success_; }
    static const ImVec4& errorColor() { return error_; }
    static const ImVec4& disabledColor() { return disabled_; }

    static void pushSectionStyle();
    static void popSectionStyle();

    // Orange fill on a dark track, matching the game's HUD
    static void pushProgressBarStyle();
    static void popProgressBarStyle();

    static ImVec4 statusColor(bool is_success, bool is_error = false, bool is_disabled = false);

    static void applyTheme();

private:
    static constexpr ImVec4 accent_     = ImVec4(1.0f, 0.478f, 0.0f, 1.0f);     // #ff7a00
    static constexpr ImVec4 track_      = ImVec4(0.165f, 0.165f, 0.165f, 1.0f); // #2a2a2a
    static constexpr ImVec4 muted_text_ = ImVec4(0.69f, 0.69f, 0.69f, 1.0f);    // #b0b0b0
    static constexpr ImVec4 warning_    = ImVec4(1.0f, 0.6f, 0.4f, 1.0f);
    static constexpr ImVec4 success_    = ImVec4(0.2f, 0.8f, 0.2f, 1.0f);
    static constexpr ImVec4 error_      = ImVec4(0.8f, 0.2f, 0.2f, 1.0f);
    static constexpr ImVec4 disabled_   = ImVec4(0.6f, 0.6f, 0.6f, 1.0f);
};
