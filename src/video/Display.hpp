// src/video/Display.hpp
#pragma once
#include <SDL.h>
#include <array>
#include <cstdint>
#include <string>
#include "../system/Machine.hpp"

// Colors (RGBA8888)
constexpr uint32_t COLOR_OFF = 0x101010FF;
constexpr uint32_t COLOR_ON  = 0xE0E0E0FF;

constexpr int DEFAULT_WINDOW_SCALE = 12;

class Display {
public:
    Display();
    ~Display();

    // Create an SDL window of SCREEN_WIDTH*scale × SCREEN_HEIGHT*scale.
    bool init(const std::string& title, int scale = DEFAULT_WINDOW_SCALE);
    void cleanup();

    // Blit the 64×32 framebuffer (called once per 60Hz frame)
    void render_frame(const Machine& machine);

    // Drain SDL events: keypad changes go straight to machine.set_key().
    // Returns false once the user has asked to quit.
    bool handle_events(Machine& machine);

    void set_title(const std::string& title);
    bool is_running() const { return running; }
    bool is_paused() const { return paused; }

    // Host keyboard layout → Chip-8 keypad index, or -1 if unmapped.
    //   1 2 3 4      1 2 3 C
    //   Q W E R  ->  4 5 6 D
    //   A S D F      7 8 9 E
    //   Z X C V      A 0 B F
    static int map_scancode(SDL_Scancode sc);

private:
    SDL_Window*   window         = nullptr;
    SDL_Renderer* renderer       = nullptr;
    SDL_Texture*  screen_texture = nullptr;
    bool running = true;
    bool paused  = false;
    bool sdl_video_started = false;

    std::array<uint32_t, SCREEN_PIXELS> pixels;

    void update_texture();
};
