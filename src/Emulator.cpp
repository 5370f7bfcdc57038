#include "Emulator.hpp"
#include "RomLoader.hpp"
#include "system/Faults.hpp"
#include <filesystem>
#include <iostream>
#include <SDL.h>

static constexpr int NORMAL_FRAME_US = 16667;   // ~60 Hz in µs
static constexpr const char* WINDOW_TITLE = "Chip8VM";

Emulator::Emulator() : cpu_(machine_) {}

bool Emulator::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv, cfg_)) {
        print_usage(argv[0]);
        return false;
    }
    if (cfg_.show_help) {
        print_usage(argv[0]);
        return true;
    }

    std::cout << "╔════════════════════════════════════════╗\n"
              << "║         Welcome to Chip8VM             ║\n"
              << "║        CHIP-8 Virtual Machine          ║\n"
              << "╚════════════════════════════════════════╝\n";

    try {
        rom_path_ = RomLoader::load(cfg_.rom, machine_);
    } catch (const RomLoadError& e) {
        std::cerr << "ROM Load Failed: " << e.what() << "\n";
        return false;
    }

    uint32_t seed = cfg_.seed_given
        ? cfg_.seed
        : static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    cpu_.seed(seed);
    cpu_.set_quirks(cfg_.quirks);
    cpu_.set_unknown_policy(cfg_.unknown_policy);
    std::cout << "[CPU] " << cfg_.ips << " instructions/s, unknown opcodes: "
              << (cfg_.unknown_policy == UnknownOpcodePolicy::HALT ? "halt" : "skip")
              << (cfg_.quirks.shift_uses_vy ? ", shift-vy" : "")
              << (cfg_.quirks.load_store_increments_i ? ", load-store-i" : "")
              << "\n";

    if (!display_.init(WINDOW_TITLE, cfg_.scale)) {
        std::cerr << "Failed to initialize display\n";
        display_.cleanup();
        return false;
    }
    update_title();

    if (!cfg_.mute)
        sound_.init(cfg_.tone_hz);  // non-fatal: logs a warning if SDL audio unavailable

    frame_start_ = std::chrono::steady_clock::now();
    return true;
}

int Emulator::run() {
    int exit_code = 0;

    while (display_.is_running()) {
        display_.handle_events(machine_);

        if (!display_.is_paused()) {
            try {
                step_frame();
            } catch (const VmFault& e) {
                std::cerr << "[FAULT] " << e.what() << "  ("
                          << disassemble(cpu_.last_instruction()) << ")\n";
                debugger_.dump(cfg_.trace_path);
                exit_code = 2;
                break;
            }
            // Timers decay once per frame, never per instruction.
            cpu_.tick_timers();
            sound_.update(machine_.is_sound_active());
        } else {
            sound_.update(false);
        }
        sound_.flush();

        update_title();
        if (machine_.is_framebuffer_dirty()) {
            display_.render_frame(machine_);
            machine_.clear_dirty();
        }

        pace_frame();
        frame_start_ = std::chrono::steady_clock::now();
        frame_count_++;
    }

    sound_.cleanup();
    display_.cleanup();
    SDL_Quit();
    std::cout << "Chip8VM shutdown complete ("
              << cpu_.instruction_count() << " instructions, "
              << frame_count_ << " frames).\n";
    return exit_code;
}

void Emulator::step_frame() {
    step_credit_ += static_cast<double>(cfg_.ips) / 60.0;
    int budget = static_cast<int>(step_credit_);
    step_credit_ -= budget;

    for (int n = 0; n < budget; n++) {
        if (!machine_.is_awaiting_key())
            debugger_.record(machine_, frame_count_);
        if (cpu_.step() == StepResult::AWAITING_KEY)
            break;  // nothing to do until the next batch of input events
    }
}

void Emulator::update_title() {
    bool paused  = display_.is_paused();
    bool waiting = machine_.is_awaiting_key();
    if (frame_count_ > 0 && paused == prev_paused_ && waiting == prev_waiting_) return;

    std::string title = std::string(WINDOW_TITLE) + " - " +
                        std::filesystem::path(rom_path_).filename().string();
    if (paused)       title += " [PAUSED]";
    else if (waiting) title += " [WAITING FOR KEY]";
    display_.set_title(title);

    prev_paused_  = paused;
    prev_waiting_ = waiting;
}

void Emulator::pace_frame() {
    auto now     = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                       now - frame_start_).count();
    if (elapsed < NORMAL_FRAME_US)
        SDL_Delay(static_cast<uint32_t>((NORMAL_FRAME_US - elapsed) / 1000));
}
