// src/cpu/decoder.hpp
#pragma once
#include <cstdint>
#include <string>

// Every instruction form the interpreter understands.  UNKNOWN covers
// anything else (0NNN machine-code calls, malformed 5/8/9/E/F patterns,
// Super-Chip extensions) and is handled by the unknown-opcode policy.
enum class Op : uint8_t {
    CLS,        // 00E0
    RET,        // 00EE
    JP,         // 1NNN
    CALL,       // 2NNN
    SE_VX_NN,   // 3XNN
    SNE_VX_NN,  // 4XNN
    SE_VX_VY,   // 5XY0
    LD_VX_NN,   // 6XNN
    ADD_VX_NN,  // 7XNN
    LD_VX_VY,   // 8XY0
    OR,         // 8XY1
    AND,        // 8XY2
    XOR,        // 8XY3
    ADD_VX_VY,  // 8XY4
    SUB,        // 8XY5
    SHR,        // 8XY6
    SUBN,       // 8XY7
    SHL,        // 8XYE
    SNE_VX_VY,  // 9XY0
    LD_I,       // ANNN
    JP_V0,      // BNNN
    RND,        // CXNN
    DRW,        // DXYN
    SKP,        // EX9E
    SKNP,       // EXA1
    LD_VX_DT,   // FX07
    LD_VX_K,    // FX0A
    LD_DT_VX,   // FX15
    LD_ST_VX,   // FX18
    ADD_I_VX,   // FX1E
    LD_F_VX,    // FX29
    LD_B_VX,    // FX33
    LD_MEM_VX,  // FX55
    LD_VX_MEM,  // FX65
    UNKNOWN,
};

struct Instruction {
    Op       op     = Op::UNKNOWN;
    uint16_t raw    = 0;
    uint8_t  x      = 0;   // bits 11..8
    uint8_t  y      = 0;   // bits 7..4
    uint8_t  n      = 0;   // bits 3..0
    uint8_t  nn     = 0;   // bits 7..0
    uint16_t nnn    = 0;   // bits 11..0
};

// Pure nibble-pattern decode; never fails.
Instruction decode(uint16_t opcode);

// Mnemonic text for traces and fault reports, e.g. "ADD V3, V4".
std::string disassemble(const Instruction& ins);
