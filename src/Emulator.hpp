#pragma once
#include "system/Machine.hpp"
#include "cpu/chip8.hpp"
#include "video/Display.hpp"
#include "Config.hpp"
#include "Debugger.hpp"
#include "Sound.hpp"
#include <chrono>
#include <string>

// Top-level emulator.  Owns the Machine, CPU, Display and all subsystems.
// Call init() once, then run() to enter the main loop.
class Emulator {
public:
    Emulator();
    bool init(int argc, char* argv[]);

    // Returns the process exit code: 0 on a normal quit, 2 on a VM fault.
    int run();

    // init() succeeded only to print --help
    bool help_shown() const { return cfg_.show_help; }

private:
    // Member declaration order matters: machine_ must precede cpu_ so that
    // machine_ is fully constructed before cpu_(machine_) runs.
    Machine  machine_;
    Chip8    cpu_;
    Display  display_;
    Sound    sound_;
    Debugger debugger_;
    Config   cfg_;

    std::string rom_path_;
    uint64_t frame_count_   = 0;
    double   step_credit_   = 0.0;   // fractional instructions carried between frames
    bool     prev_paused_   = false;
    bool     prev_waiting_  = false;
    std::chrono::steady_clock::time_point frame_start_;

    void step_frame();
    void update_title();
    void pace_frame();
};
