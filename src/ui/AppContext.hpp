#pragma once

#include <SDL3/SDL.h>
#include <string>

class AppContext
{
public:
    AppContext();
    ~AppContext();

    bool initialize();
    void shutdown();

    bool processEvent(const SDL_Event& event);
    void beginFrame();
    void endFrame();

    SDL_Window* window() const { return window_; }

    SDL_Renderer* renderer() const { return renderer_; }

    static constexpr int kWindowWidth = 940;
    static constexpr int kWindowHeight = 720;

private:
    void updateRendererScale();

    // Initialization phase helpers
    bool initializeSDL();
    bool createWindow();
    bool createRenderer();
    bool initializeImGui();
    void reportInitError(const char* phase, const std::string& i18n_key, const std::string& details);

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    bool initialized_ = false;
    bool sdl_initialized_ = false;
    bool imgui_initialized_ = false;
};
