#include "Config.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

// Strict decimal parse into [lo, hi].
static bool parse_int(const char* flag, const char* text, long lo, long hi, long& out) {
    errno = 0;
    char* end = nullptr;
    long val = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        std::cerr << "[CONFIG] " << flag << ": not a number: '" << text << "'\n";
        return false;
    }
    if (val < lo || val > hi) {
        std::cerr << "[CONFIG] " << flag << ": " << val << " out of range ["
                  << lo << ", " << hi << "]\n";
        return false;
    }
    out = val;
    return true;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <rom>\n"
              << "  --rom <path|name>          ROM file, or name prefix in roms/\n"
              << "  --ips <n>                  instructions per second (default 700)\n"
              << "  --scale <n>                window scale (default 12)\n"
              << "  --seed <n>                 RNG seed for CXNN\n"
              << "  --unknown-opcode halt|skip policy for undefined opcodes (default halt)\n"
              << "  --quirk-shift-vy           8XY6/8XYE shift VY into VX\n"
              << "  --quirk-load-store-i       FX55/FX65 advance I\n"
              << "  --tone <hz>                beeper frequency (default 440)\n"
              << "  --mute                     disable audio\n"
              << "  --trace <path>             trace dump file (default trace.log)\n"
              << "  --help                     show this text\n";
}

bool parse_args(int argc, const char* const argv[], Config& cfg) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value  = (i + 1 < argc);
        long val = 0;

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            cfg.show_help = true;
        } else if (std::strcmp(arg, "--mute") == 0) {
            cfg.mute = true;
        } else if (std::strcmp(arg, "--quirk-shift-vy") == 0) {
            cfg.quirks.shift_uses_vy = true;
        } else if (std::strcmp(arg, "--quirk-load-store-i") == 0) {
            cfg.quirks.load_store_increments_i = true;
        } else if (std::strcmp(arg, "--rom") == 0 || std::strcmp(arg, "--ips") == 0 ||
                   std::strcmp(arg, "--scale") == 0 || std::strcmp(arg, "--seed") == 0 ||
                   std::strcmp(arg, "--tone") == 0 || std::strcmp(arg, "--trace") == 0 ||
                   std::strcmp(arg, "--unknown-opcode") == 0) {
            if (!has_value) {
                std::cerr << "[CONFIG] " << arg << " needs a value\n";
                return false;
            }
            const char* value = argv[++i];

            if (std::strcmp(arg, "--rom") == 0) {
                cfg.rom = value;
            } else if (std::strcmp(arg, "--trace") == 0) {
                cfg.trace_path = value;
            } else if (std::strcmp(arg, "--ips") == 0) {
                if (!parse_int(arg, value, Config::MIN_IPS, Config::MAX_IPS, val)) return false;
                cfg.ips = static_cast<int>(val);
            } else if (std::strcmp(arg, "--scale") == 0) {
                if (!parse_int(arg, value, Config::MIN_SCALE, Config::MAX_SCALE, val)) return false;
                cfg.scale = static_cast<int>(val);
            } else if (std::strcmp(arg, "--tone") == 0) {
                if (!parse_int(arg, value, Config::MIN_TONE, Config::MAX_TONE, val)) return false;
                cfg.tone_hz = static_cast<int>(val);
            } else if (std::strcmp(arg, "--seed") == 0) {
                if (!parse_int(arg, value, 0, 0x7FFFFFFFL, val)) return false;
                cfg.seed       = static_cast<uint32_t>(val);
                cfg.seed_given = true;
            } else {
                if (std::strcmp(value, "halt") == 0) {
                    cfg.unknown_policy = UnknownOpcodePolicy::HALT;
                } else if (std::strcmp(value, "skip") == 0) {
                    cfg.unknown_policy = UnknownOpcodePolicy::SKIP;
                } else {
                    std::cerr << "[CONFIG] --unknown-opcode: expected halt or skip, got '"
                              << value << "'\n";
                    return false;
                }
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::cerr << "[CONFIG] Unknown option: " << arg << "\n";
            return false;
        } else if (cfg.rom.empty()) {
            cfg.rom = arg;
        } else {
            std::cerr << "[CONFIG] Unexpected argument: " << arg << "\n";
            return false;
        }
    }

    if (cfg.rom.empty() && !cfg.show_help) {
        std::cerr << "[CONFIG] No ROM given\n";
        return false;
    }
    return true;
}
