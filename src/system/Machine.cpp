// src/system/Machine.cpp
#include "Machine.hpp"
#include "Faults.hpp"
#include "FontRom.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>

Machine::Machine() {
    reset();
}

void Machine::reset() {
    memory_.fill(0x00);
    v_.fill(0x00);
    index_ = 0;
    pc_    = PROGRAM_START;
    stack_.fill(0x0000);
    sp_    = 0;
    delay_timer_ = 0;
    sound_timer_ = 0;
    keys_.fill(false);
    awaiting_key_  = false;
    key_wait_reg_  = 0;
    pressed_mask_  = 0;
    first_pressed_ = 0;
    framebuffer_.fill(0);
    fb_dirty_ = true;

    std::copy(CHIP8_FONT.begin(), CHIP8_FONT.end(), memory_.begin() + FONT_START);
}

void Machine::load_rom(const std::vector<uint8_t>& bytes) {
    if (bytes.size() > MAX_ROM_SIZE) {
        throw RomLoadError("ROM too large: " + std::to_string(bytes.size()) +
                           " bytes (max " + std::to_string(MAX_ROM_SIZE) + ")");
    }
    std::copy(bytes.begin(), bytes.end(), memory_.begin() + PROGRAM_START);
}

// ============================================================================
// MEMORY
// ============================================================================
void Machine::check_address(uint16_t addr, const char* access) const {
    if (addr >= MEMORY_SIZE) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "%s out of range: 0x%04X", access,
                      static_cast<unsigned>(addr));
        throw VmFault(msg);
    }
}

uint8_t Machine::read_byte(uint16_t addr) const {
    check_address(addr, "memory read");
    return memory_[addr];
}

void Machine::write_byte(uint16_t addr, uint8_t val) {
    check_address(addr, "memory write");
    if (addr <= RESERVED_END) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "write to interpreter memory: 0x%04X",
                      static_cast<unsigned>(addr));
        throw VmFault(msg);
    }
    memory_[addr] = val;
}

uint16_t Machine::read_word(uint16_t addr) const {
    return static_cast<uint16_t>((read_byte(addr) << 8) |
                                 read_byte(static_cast<uint16_t>(addr + 1)));
}

// ============================================================================
// REGISTERS & STACK
// ============================================================================
uint8_t Machine::get_register(uint8_t x) const {
    if (x >= REGISTER_COUNT)
        throw VmFault("invalid register V" + std::to_string(x));
    return v_[x];
}

void Machine::set_register(uint8_t x, uint8_t val) {
    if (x >= REGISTER_COUNT)
        throw VmFault("invalid register V" + std::to_string(x));
    v_[x] = val;
}

void Machine::push(uint16_t addr) {
    if (sp_ >= STACK_DEPTH)
        throw VmFault("stack overflow (depth " + std::to_string(sp_) + ")");
    stack_[sp_++] = addr;
}

uint16_t Machine::pop() {
    if (sp_ == 0)
        throw VmFault("stack underflow (return with empty stack)");
    return stack_[--sp_];
}

// ============================================================================
// TIMERS
// ============================================================================
void Machine::tick_timers() {
    if (delay_timer_ > 0) --delay_timer_;
    if (sound_timer_ > 0) --sound_timer_;
}

// ============================================================================
// KEYPAD
// ============================================================================
void Machine::set_key(uint8_t key, bool down) {
    if (key >= KEY_COUNT) {
        std::cerr << "[INPUT] Ignoring key index " << static_cast<int>(key) << "\n";
        return;
    }
    if (down && !keys_[key] && awaiting_key_) {
        if (pressed_mask_ == 0) first_pressed_ = key;
        pressed_mask_ |= static_cast<uint16_t>(1u << key);
    }
    keys_[key] = down;
}

bool Machine::is_key_down(uint8_t key) const {
    return key < KEY_COUNT && keys_[key];
}

void Machine::begin_key_wait(uint8_t target_reg) {
    if (target_reg >= REGISTER_COUNT)
        throw VmFault("invalid register V" + std::to_string(target_reg));
    awaiting_key_  = true;
    key_wait_reg_  = target_reg;
    pressed_mask_  = 0;
    first_pressed_ = 0;
}

bool Machine::take_pressed_key(uint8_t& key) {
    if (!awaiting_key_ || pressed_mask_ == 0) return false;
    key = first_pressed_;
    awaiting_key_ = false;
    pressed_mask_ = 0;
    return true;
}

// ============================================================================
// FRAMEBUFFER
// ============================================================================
void Machine::clear_framebuffer() {
    framebuffer_.fill(0);
    fb_dirty_ = true;
}

bool Machine::draw_sprite(uint8_t x, uint8_t y, uint8_t rows) {
    // Origin wraps; the sprite body wraps horizontally and clips at the
    // bottom edge.
    const uint16_t x0 = x % SCREEN_WIDTH;
    const uint16_t y0 = y % SCREEN_HEIGHT;
    bool collided = false;

    for (uint8_t row = 0; row < rows; row++) {
        uint16_t py = y0 + row;
        if (py >= SCREEN_HEIGHT) break;

        uint8_t bits = read_byte(static_cast<uint16_t>(index_ + row));
        for (uint8_t col = 0; col < 8; col++) {
            if (!(bits & (0x80 >> col))) continue;
            uint16_t px = (x0 + col) % SCREEN_WIDTH;
            uint8_t& pixel = framebuffer_[py * SCREEN_WIDTH + px];
            if (pixel) collided = true;
            pixel ^= 1;
        }
    }
    fb_dirty_ = true;
    return collided;
}

bool Machine::get_pixel(uint16_t x, uint16_t y) const {
    if (x >= SCREEN_WIDTH || y >= SCREEN_HEIGHT) return false;
    return framebuffer_[y * SCREEN_WIDTH + x] != 0;
}
