// For reference see "example_sdl2_sdlrenderer2/main.cpp":
// https://github.com/ocornut/imgui/blob/master/examples/example_sdl2_sdlrenderer2/main.cpp

#include <SDL.h>

#include "imgui_impl_sdl2.h"
#include "imgui_impl_sdlrenderer2.h"

#include "common.hpp"

[[noreturn]] static void resource_failure() {
    SDL_Log("Error: %s", SDL_GetError());
    exit(EXIT_FAILURE);
}

static SDL_Window* window = nullptr;
static SDL_Renderer* renderer = nullptr;

void set_window_title(const std::string& title) {
    assert(window);
    SDL_SetWindowTitle(window, title.c_str());
}

// Manage the texture for `make_screen`; one texel per cell.
class screen_texture : no_create {
    inline static SDL_Texture* texture = nullptr;
    inline static lifebound::vecT size{};

public:
    static void begin(const lifebound::surfaceT& surface) {
        assert(window && renderer && !texture);

        // Using the same pixel format as the one in "imgui_impl_sdlrenderer2.cpp", so `ImU32` colors apply directly.
        size = surface.size();
        texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ABGR8888, SDL_TEXTUREACCESS_STREAMING, size.x, size.y);
        if (!texture) {
            resource_failure();
        }
        SDL_SetTextureBlendMode(texture, SDL_BLENDMODE_NONE);
        SDL_SetTextureScaleMode(texture, SDL_ScaleModeNearest);
    }

    static void end() {
        assert(window && renderer && texture);
        SDL_DestroyTexture(texture);
        texture = nullptr;
    }

    static SDL_Texture* get(const lifebound::vecT grid_size) {
        assert(texture && grid_size == size);
        return texture;
    }
};

ImTextureID make_screen(const lifebound::gridT& grid) {
    SDL_Texture* texture = screen_texture::get(grid.surface().size());

    void* pixels = nullptr;
    int pitch = 0;
    if (SDL_LockTexture(texture, nullptr, &pixels, &pitch) != 0) {
        resource_failure();
    }

    const int width = grid.surface().width();
    const std::span<const bool> cells = grid.data();
    for (int y = 0; y < grid.surface().height(); ++y) {
        Uint32* p = (Uint32*)((char*)pixels + pitch * y);
        for (const bool alive : cells.subspan(y * width, width)) {
            *p++ = alive ? configT::live_cell_col : configT::background_col;
        }
    }
    SDL_UnlockTexture(texture);
    return (ImTextureID)texture;
}

// The encoding of `argv` cannot be relied upon, see:
// https://stackoverflow.com/questions/5408730/what-is-the-encoding-of-argv
int main(int, char**) {
    assert(!window && !renderer);

    const std::optional<lifebound::surfaceT> surface = lifebound::make_surface(configT::window_size, configT::cell_size);
    if (!surface) {
        SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "Window size %dx%d is not a multiple of cell size %d.",
                        configT::window_size.x, configT::window_size.y, configT::cell_size);
        return EXIT_FAILURE;
    }
    SDL_Log("Surface: %dx%d cells.", surface->width(), surface->height());

    // Setup SDL
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        resource_failure();
    }

    // Create window with SDL_Renderer graphics context
    {
        // Not resizable; the surface is fixed for the whole run.
        window = SDL_CreateWindow(configT::title, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                  configT::window_size.x, configT::window_size.y, SDL_WINDOW_SHOWN);
        if (!window) {
            resource_failure();
        }
        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_PRESENTVSYNC | SDL_RENDERER_ACCELERATED);
        if (!renderer) {
            resource_failure();
        }
    }

    // Setup Dear ImGui context
    ImGui::CreateContext();
    {
        char* const base_path = SDL_GetBasePath();
        if (!set_pattern_dir(base_path)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot find the pattern folder.");
        }
        if (base_path) {
            SDL_free(base_path);
        }
    }

    ImGui::GetIO().IniFilename = nullptr;
    ImGui::GetIO().LogFilename = nullptr;

    // Setup Dear ImGui style
    ImGui::StyleColorsDark();

    // Setup Platform/Renderer backends
    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    auto begin_frame = [] {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) {
                return false;
            }
        }

        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();
        return true;
    };

    auto end_frame = [] {
        ImGui::Render();
        const ImGuiIO& io = ImGui::GetIO();
        SDL_RenderSetScale(renderer, io.DisplayFramebufferScale.x, io.DisplayFramebufferScale.y);

        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);

        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
    };

    screen_texture::begin(*surface);
    while (begin_frame()) {
        const bool keep_running = frame_main(*surface);

        end_frame();
        if (!keep_running) {
            break;
        }

        // Limit the framerate; generations are paced separately in `frame_main`.
        static Uint64 last = 0;
        const Uint64 now = SDL_GetTicks64();
        const Uint64 until = last + 1000 / configT::max_fps;
        if (now < until) {
            SDL_Delay(until - now);
            last = until; // Instead of another `SDL_GetTicks64()` call.
        } else {
            last = now;
        }
    }
    screen_texture::end();

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    window = nullptr;
    renderer = nullptr;

    return 0;
}
