#pragma once
#include <cstdint>
#include <string>
#include "cpu/chip8.hpp"

// Session settings gathered from the command line.
struct Config {
    std::string rom;                     // path or roms/ name prefix
    int         ips          = 700;      // instructions per second
    int         scale        = 12;       // window pixels per Chip-8 pixel
    uint32_t    seed         = 0;
    bool        seed_given   = false;    // otherwise seeded from the clock
    int         tone_hz      = 440;
    bool        mute         = false;
    std::string trace_path   = "trace.log";
    Quirks      quirks;
    UnknownOpcodePolicy unknown_policy = UnknownOpcodePolicy::HALT;
    bool        show_help    = false;

    static constexpr int MIN_IPS   = 60;
    static constexpr int MAX_IPS   = 100000;
    static constexpr int MIN_SCALE = 1;
    static constexpr int MAX_SCALE = 64;
    static constexpr int MIN_TONE  = 20;
    static constexpr int MAX_TONE  = 20000;
};

// Fill cfg from argv.  Prints the problem to std::cerr and returns false on
// an unknown flag, a missing value, or a value out of range.
bool parse_args(int argc, const char* const argv[], Config& cfg);

void print_usage(const char* prog);
