// src/system/FontRom.hpp
#pragma once
#include <array>
#include <cstdint>

// ============================================================================
// BUILT-IN HEX FONT
// ============================================================================
// 16 glyphs (0-F), 5 bytes each, 4 pixels wide in the high nibble.
// Copied into interpreter memory at FONT_START on every reset.
// ============================================================================

constexpr uint16_t FONT_GLYPH_BYTES = 5;
constexpr uint16_t FONT_GLYPHS      = 16;

constexpr std::array<uint8_t, FONT_GLYPHS * FONT_GLYPH_BYTES> CHIP8_FONT = {
    0xF0, 0x90, 0x90, 0x90, 0xF0,  // 0
    0x20, 0x60, 0x20, 0x20, 0x70,  // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0,  // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0,  // 3
    0x90, 0x90, 0xF0, 0x10, 0x10,  // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0,  // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0,  // 6
    0xF0, 0x10, 0x20, 0x40, 0x40,  // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0,  // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0,  // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90,  // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0,  // B
    0xF0, 0x80, 0x80, 0x80, 0xF0,  // C
    0xE0, 0x90, 0x90, 0x90, 0xE0,  // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0,  // E
    0xF0, 0x80, 0xF0, 0x80, 0x80,  // F
};
