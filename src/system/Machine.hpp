// src/system/Machine.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

// ============================================================================
// CHIP-8 MEMORY MAP
// ============================================================================
// 0x000 - 0x1FF : Interpreter area (read-only once initialised)
//   0x050 - 0x09F : Built-in hex font (16 glyphs × 5 bytes)
// 0x200 - 0xFFF : Program ROM / RAM
// ============================================================================

constexpr uint16_t MEMORY_SIZE    = 0x1000;  // 4KB
constexpr uint16_t RESERVED_END   = 0x01FF;
constexpr uint16_t FONT_START     = 0x0050;
constexpr uint16_t PROGRAM_START  = 0x0200;
constexpr size_t   MAX_ROM_SIZE   = MEMORY_SIZE - PROGRAM_START;  // 3584 bytes

constexpr uint8_t  REGISTER_COUNT = 16;
constexpr uint8_t  FLAG_REGISTER  = 0xF;    // VF: carry / borrow / collision
constexpr uint8_t  STACK_DEPTH    = 16;
constexpr uint8_t  KEY_COUNT      = 16;

constexpr uint16_t SCREEN_WIDTH   = 64;
constexpr uint16_t SCREEN_HEIGHT  = 32;
constexpr uint16_t SCREEN_PIXELS  = SCREEN_WIDTH * SCREEN_HEIGHT;

using Framebuffer = std::array<uint8_t, SCREEN_PIXELS>;

// All mutable VM state for one emulation session.  Every primitive enforces
// its own bounds; violations throw VmFault (see Faults.hpp).
class Machine {
public:
    Machine();

    // Zero everything, reload the font, PC = 0x200.
    void reset();

    // Copy a program image to 0x200.  Throws RomLoadError if it does not
    // fit; memory is left untouched in that case.
    void load_rom(const std::vector<uint8_t>& bytes);

    // Memory Interface
    uint8_t read_byte(uint16_t addr) const;
    void write_byte(uint16_t addr, uint8_t val);
    uint16_t read_word(uint16_t addr) const;  // big-endian opcode fetch

    // Register Interface
    uint8_t get_register(uint8_t x) const;
    void set_register(uint8_t x, uint8_t val);
    uint16_t get_index() const { return index_; }
    void set_index(uint16_t val) { index_ = val; }
    uint16_t get_pc() const { return pc_; }
    void set_pc(uint16_t val) { pc_ = val; }

    // Call Stack
    void push(uint16_t addr);
    uint16_t pop();
    uint8_t stack_depth() const { return sp_; }

    // Timers (call tick_timers() at 60Hz, independent of instruction rate)
    void tick_timers();
    uint8_t get_delay_timer() const { return delay_timer_; }
    void set_delay_timer(uint8_t val) { delay_timer_ = val; }
    uint8_t get_sound_timer() const { return sound_timer_; }
    void set_sound_timer(uint8_t val) { sound_timer_ = val; }
    bool is_sound_active() const { return sound_timer_ > 0; }

    // Keypad (written by the host input adapter)
    void set_key(uint8_t key, bool down);
    bool is_key_down(uint8_t key) const;

    // FX0A support.  While awaiting, only keys that go from up to down
    // count; keys already held when the wait began are ignored.
    void begin_key_wait(uint8_t target_reg);
    bool is_awaiting_key() const { return awaiting_key_; }
    uint8_t key_wait_register() const { return key_wait_reg_; }
    // Returns true and ends the wait if a key went down since it began.
    bool take_pressed_key(uint8_t& key);

    // Framebuffer
    void clear_framebuffer();
    bool draw_sprite(uint8_t x, uint8_t y, uint8_t rows);
    bool get_pixel(uint16_t x, uint16_t y) const;
    const Framebuffer& get_framebuffer() const { return framebuffer_; }
    bool is_framebuffer_dirty() const { return fb_dirty_; }
    void clear_dirty() { fb_dirty_ = false; }

private:
    std::array<uint8_t, MEMORY_SIZE>     memory_{};
    std::array<uint8_t, REGISTER_COUNT>  v_{};
    uint16_t index_ = 0;
    uint16_t pc_    = PROGRAM_START;

    std::array<uint16_t, STACK_DEPTH>    stack_{};
    uint8_t  sp_    = 0;  // number of entries in use

    uint8_t  delay_timer_ = 0;
    uint8_t  sound_timer_ = 0;

    std::array<bool, KEY_COUNT> keys_{};
    bool     awaiting_key_  = false;
    uint8_t  key_wait_reg_  = 0;
    uint16_t pressed_mask_  = 0;  // bit n: key n went down during the wait
    uint8_t  first_pressed_ = 0;

    Framebuffer framebuffer_{};
    bool        fb_dirty_ = true;

    void check_address(uint16_t addr, const char* access) const;
};
