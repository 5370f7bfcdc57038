// src/video/Display.cpp
#include "Display.hpp"
#include <iostream>

Display::Display() {
    pixels.fill(COLOR_OFF);
}

Display::~Display() {
    cleanup();
}

// ============================================================================
// SDL INITIALIZATION
// ============================================================================
bool Display::init(const std::string& title, int scale) {
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) < 0) {
        std::cerr << "SDL Video Init Failed: " << SDL_GetError() << std::endl;
        return false;
    }
    sdl_video_started = true;

    window = SDL_CreateWindow(
        title.c_str(),
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        SCREEN_WIDTH * scale,
        SCREEN_HEIGHT * scale,
        SDL_WINDOW_SHOWN
    );

    if (!window) {
        std::cerr << "SDL Window Creation Failed: " << SDL_GetError() << std::endl;
        return false;
    }

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::cerr << "SDL Renderer Creation Failed: " << SDL_GetError() << std::endl;
        return false;
    }

    // Nearest-neighbour so each Chip-8 pixel stays a crisp square
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "nearest");

    screen_texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_RGBA8888,
        SDL_TEXTUREACCESS_STREAMING,
        SCREEN_WIDTH,
        SCREEN_HEIGHT
    );

    if (!screen_texture) {
        std::cerr << "SDL Texture Creation Failed: " << SDL_GetError() << std::endl;
        return false;
    }

    std::cout << "Display initialized: " << SCREEN_WIDTH * scale << "×"
              << SCREEN_HEIGHT * scale << std::endl;
    return true;
}

void Display::cleanup() {
    if (screen_texture) {
        SDL_DestroyTexture(screen_texture);
        screen_texture = nullptr;
    }
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    if (sdl_video_started) {
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        sdl_video_started = false;
    }
}

// ============================================================================
// FRAME RENDERING (Called once per 60Hz frame)
// ============================================================================
void Display::render_frame(const Machine& machine) {
    if (!screen_texture) return;

    const Framebuffer& fb = machine.get_framebuffer();
    for (size_t i = 0; i < fb.size(); i++)
        pixels[i] = fb[i] ? COLOR_ON : COLOR_OFF;

    update_texture();
}

void Display::update_texture() {
    SDL_UpdateTexture(screen_texture, nullptr, pixels.data(),
                      SCREEN_WIDTH * sizeof(uint32_t));
    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, screen_texture, nullptr, nullptr);
    SDL_RenderPresent(renderer);
}

// ============================================================================
// INPUT HANDLING
// ============================================================================
int Display::map_scancode(SDL_Scancode sc) {
    switch (sc) {
        case SDL_SCANCODE_1: return 0x1;
        case SDL_SCANCODE_2: return 0x2;
        case SDL_SCANCODE_3: return 0x3;
        case SDL_SCANCODE_4: return 0xC;
        case SDL_SCANCODE_Q: return 0x4;
        case SDL_SCANCODE_W: return 0x5;
        case SDL_SCANCODE_E: return 0x6;
        case SDL_SCANCODE_R: return 0xD;
        case SDL_SCANCODE_A: return 0x7;
        case SDL_SCANCODE_S: return 0x8;
        case SDL_SCANCODE_D: return 0x9;
        case SDL_SCANCODE_F: return 0xE;
        case SDL_SCANCODE_Z: return 0xA;
        case SDL_SCANCODE_Y: return 0xA;   // QWERTZ layouts
        case SDL_SCANCODE_X: return 0x0;
        case SDL_SCANCODE_C: return 0xB;
        case SDL_SCANCODE_V: return 0xF;
        default:             return -1;
    }
}

bool Display::handle_events(Machine& machine) {
    SDL_Event event;

    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_QUIT) {
            running = false;
            return false;
        }

        if (event.type == SDL_KEYDOWN || event.type == SDL_KEYUP) {
            bool pressed = (event.type == SDL_KEYDOWN);
            SDL_Scancode sc = event.key.keysym.scancode;

            if (sc == SDL_SCANCODE_ESCAPE && pressed) {
                running = false;
                return false;
            }
            if (sc == SDL_SCANCODE_P && pressed && !event.key.repeat) {
                paused = !paused;
                continue;
            }

            int key = map_scancode(sc);
            if (key >= 0)
                machine.set_key(static_cast<uint8_t>(key), pressed);
        }
    }

    return running;
}

void Display::set_title(const std::string& title) {
    if (window) {
        SDL_SetWindowTitle(window, title.c_str());
    }
}
