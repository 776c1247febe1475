#include "AppContext.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/NativeMessageBox.hpp"
#include "app/Version.hpp"

#include <SDL3/SDL.h>
#include <imgui.h>
#include <backends/imgui_impl_sdl3.h>
#include <backends/imgui_impl_sdlrenderer3.h>
#include <plog/Log.h>
#include <cmath>
#include "ui/Localization.hpp"
#include "UITheme.hpp"

AppContext::AppContext() = default;

AppContext::~AppContext()
{
    shutdown();
}

// Bootstraps SDL window/renderer and ImGui backends.
bool AppContext::initialize()
{
    if (initialized_)
        return true;

    if (!initializeSDL()) return false;
    if (!createWindow()) return false;
    if (!createRenderer()) return false;
    if (!initializeImGui()) return false;

    initialized_ = true;
    return true;
}

// Tears down whatever the init phases managed to create.
void AppContext::shutdown()
{
    if (imgui_initialized_)
    {
        ImGui_ImplSDLRenderer3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        imgui_initialized_ = false;
    }
    if (ImGui::GetCurrentContext())
        ImGui::DestroyContext();

    if (renderer_)
    {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_)
    {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }

    if (sdl_initialized_)
    {
        SDL_Quit();
        sdl_initialized_ = false;
    }
    initialized_ = false;
}

// Forwards events to ImGui and reports platform quit requests.
bool AppContext::processEvent(const SDL_Event& event)
{
    ImGui_ImplSDL3_ProcessEvent(&event);

    if (event.type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED ||
        event.type == SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED)
    {
        if (window_ && renderer_ && event.window.windowID == SDL_GetWindowID(window_))
            updateRendererScale();
    }

    if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED && window_ &&
        event.window.windowID == SDL_GetWindowID(window_))
        return true;

    return event.type == SDL_EVENT_QUIT;
}

void AppContext::beginFrame()
{
    ImGui_ImplSDLRenderer3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();
}

void AppContext::endFrame()
{
    ImGui::Render();
    SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
    SDL_RenderClear(renderer_);
    ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer_);
    SDL_RenderPresent(renderer_);
}

void AppContext::updateRendererScale()
{
    if (!window_ || !renderer_)
        return;

    if (SDL_GetWindowFlags(window_) & SDL_WINDOW_MINIMIZED)
        return;

    int w = 0, h = 0;
    int pw = 0, ph = 0;
    SDL_GetWindowSize(window_, &w, &h);
    SDL_GetWindowSizeInPixels(window_, &pw, &ph);

    float sx = (w > 0) ? (float)pw / (float)w : 1.0f;
    float sy = (h > 0) ? (float)ph / (float)h : 1.0f;
    if (sx <= 0.0f || !std::isfinite(sx)) sx = 1.0f;
    if (sy <= 0.0f || !std::isfinite(sy)) sy = 1.0f;

    auto quantize = [](float v) {
        return std::round(v * 1000.0f) / 1000.0f;
    };
    sx = quantize(sx);
    sy = quantize(sy);

    float curx = 1.0f, cury = 1.0f;
    SDL_GetRenderScale(renderer_, &curx, &cury);
    if (quantize(curx) == sx && quantize(cury) == sy)
        return;

    if (!SDL_SetRenderScale(renderer_, sx, sy))
    {
        PLOG_WARNING << "SDL_SetRenderScale(" << sx << "," << sy << ") failed: " << SDL_GetError()
                     << " w=" << w << " h=" << h << " pw=" << pw << " ph=" << ph;
    }
}

bool AppContext::initializeSDL()
{
    if (!SDL_Init(SDL_INIT_VIDEO))
    {
        reportInitError("SDL", "app.init.graphics_failed", std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }
    sdl_initialized_ = true;
    return true;
}

bool AppContext::createWindow()
{
    const SDL_WindowFlags window_flags = SDL_WINDOW_HIGH_PIXEL_DENSITY;
    const std::string title = std::string("ED Backup ") + EDB_VERSION_STRING;
    window_ = SDL_CreateWindow(title.c_str(), kWindowWidth, kWindowHeight, window_flags);
    if (!window_)
    {
        reportInitError("Window", "app.init.window_failed", std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        shutdown();
        return false;
    }
    return true;
}

bool AppContext::createRenderer()
{
    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (!renderer_)
    {
        reportInitError("Renderer", "app.init.renderer_failed", std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        shutdown();
        return false;
    }

    if (!SDL_SetRenderVSync(renderer_, 1))
    {
        PLOG_WARNING << "Failed to enable VSync: " << SDL_GetError() << " (will continue without VSync)";
    }

    updateRendererScale();
    return true;
}

bool AppContext::initializeImGui()
{
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    {
        ImGuiIO& io = ImGui::GetIO();
        // Window layout is fixed; nothing worth persisting in imgui.ini
        io.IniFilename = nullptr;
    }
    ImGui::StyleColorsDark();
    UITheme::applyTheme();

    if (!ImGui_ImplSDL3_InitForSDLRenderer(window_, renderer_))
    {
        reportInitError("ImGui SDL3 Backend", "app.init.ui_backend_failed", "ImGui_ImplSDL3_InitForSDLRenderer returned false");
        shutdown();
        return false;
    }

    if (!ImGui_ImplSDLRenderer3_Init(renderer_))
    {
        ImGui_ImplSDL3_Shutdown();
        reportInitError("ImGui Renderer Backend", "app.init.ui_renderer_failed", "ImGui_ImplSDLRenderer3_Init returned false");
        shutdown();
        return false;
    }

    imgui_initialized_ = true;
    return true;
}

void AppContext::reportInitError(const char* phase, const std::string& i18n_key, const std::string& details)
{
    PLOG_FATAL << phase << " initialization failed: " << details;
    utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, i18n::get_str(i18n_key), details);
    utils::NativeMessageBox::ShowFatalError(i18n::get_str(i18n_key + "_long"), details);
}
