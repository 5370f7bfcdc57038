// src/cpu/decoder.cpp
#include "decoder.hpp"
#include <cstdio>

Instruction decode(uint16_t opcode) {
    Instruction ins;
    ins.raw = opcode;
    ins.x   = (opcode >> 8) & 0x0F;
    ins.y   = (opcode >> 4) & 0x0F;
    ins.n   = opcode & 0x0F;
    ins.nn  = opcode & 0xFF;
    ins.nnn = opcode & 0x0FFF;

    switch (opcode >> 12) {
        case 0x0:
            if (opcode == 0x00E0)      ins.op = Op::CLS;
            else if (opcode == 0x00EE) ins.op = Op::RET;
            break;
        case 0x1: ins.op = Op::JP; break;
        case 0x2: ins.op = Op::CALL; break;
        case 0x3: ins.op = Op::SE_VX_NN; break;
        case 0x4: ins.op = Op::SNE_VX_NN; break;
        case 0x5:
            if (ins.n == 0x0) ins.op = Op::SE_VX_VY;
            break;
        case 0x6: ins.op = Op::LD_VX_NN; break;
        case 0x7: ins.op = Op::ADD_VX_NN; break;
        case 0x8:
            switch (ins.n) {
                case 0x0: ins.op = Op::LD_VX_VY; break;
                case 0x1: ins.op = Op::OR; break;
                case 0x2: ins.op = Op::AND; break;
                case 0x3: ins.op = Op::XOR; break;
                case 0x4: ins.op = Op::ADD_VX_VY; break;
                case 0x5: ins.op = Op::SUB; break;
                case 0x6: ins.op = Op::SHR; break;
                case 0x7: ins.op = Op::SUBN; break;
                case 0xE: ins.op = Op::SHL; break;
                default: break;
            }
            break;
        case 0x9:
            if (ins.n == 0x0) ins.op = Op::SNE_VX_VY;
            break;
        case 0xA: ins.op = Op::LD_I; break;
        case 0xB: ins.op = Op::JP_V0; break;
        case 0xC: ins.op = Op::RND; break;
        case 0xD: ins.op = Op::DRW; break;
        case 0xE:
            if (ins.nn == 0x9E)      ins.op = Op::SKP;
            else if (ins.nn == 0xA1) ins.op = Op::SKNP;
            break;
        case 0xF:
            switch (ins.nn) {
                case 0x07: ins.op = Op::LD_VX_DT; break;
                case 0x0A: ins.op = Op::LD_VX_K; break;
                case 0x15: ins.op = Op::LD_DT_VX; break;
                case 0x18: ins.op = Op::LD_ST_VX; break;
                case 0x1E: ins.op = Op::ADD_I_VX; break;
                case 0x29: ins.op = Op::LD_F_VX; break;
                case 0x33: ins.op = Op::LD_B_VX; break;
                case 0x55: ins.op = Op::LD_MEM_VX; break;
                case 0x65: ins.op = Op::LD_VX_MEM; break;
                default: break;
            }
            break;
    }
    return ins;
}

std::string disassemble(const Instruction& ins) {
    char buf[32] = {};
    const unsigned x = ins.x, y = ins.y, n = ins.n, nn = ins.nn, nnn = ins.nnn;

    switch (ins.op) {
        case Op::CLS:       return "CLS";
        case Op::RET:       return "RET";
        case Op::JP:        std::snprintf(buf, sizeof(buf), "JP 0x%03X", nnn); break;
        case Op::CALL:      std::snprintf(buf, sizeof(buf), "CALL 0x%03X", nnn); break;
        case Op::SE_VX_NN:  std::snprintf(buf, sizeof(buf), "SE V%X, 0x%02X", x, nn); break;
        case Op::SNE_VX_NN: std::snprintf(buf, sizeof(buf), "SNE V%X, 0x%02X", x, nn); break;
        case Op::SE_VX_VY:  std::snprintf(buf, sizeof(buf), "SE V%X, V%X", x, y); break;
        case Op::LD_VX_NN:  std::snprintf(buf, sizeof(buf), "LD V%X, 0x%02X", x, nn); break;
        case Op::ADD_VX_NN: std::snprintf(buf, sizeof(buf), "ADD V%X, 0x%02X", x, nn); break;
        case Op::LD_VX_VY:  std::snprintf(buf, sizeof(buf), "LD V%X, V%X", x, y); break;
        case Op::OR:        std::snprintf(buf, sizeof(buf), "OR V%X, V%X", x, y); break;
        case Op::AND:       std::snprintf(buf, sizeof(buf), "AND V%X, V%X", x, y); break;
        case Op::XOR:       std::snprintf(buf, sizeof(buf), "XOR V%X, V%X", x, y); break;
        case Op::ADD_VX_VY: std::snprintf(buf, sizeof(buf), "ADD V%X, V%X", x, y); break;
        case Op::SUB:       std::snprintf(buf, sizeof(buf), "SUB V%X, V%X", x, y); break;
        case Op::SHR:       std::snprintf(buf, sizeof(buf), "SHR V%X, V%X", x, y); break;
        case Op::SUBN:      std::snprintf(buf, sizeof(buf), "SUBN V%X, V%X", x, y); break;
        case Op::SHL:       std::snprintf(buf, sizeof(buf), "SHL V%X, V%X", x, y); break;
        case Op::SNE_VX_VY: std::snprintf(buf, sizeof(buf), "SNE V%X, V%X", x, y); break;
        case Op::LD_I:      std::snprintf(buf, sizeof(buf), "LD I, 0x%03X", nnn); break;
        case Op::JP_V0:     std::snprintf(buf, sizeof(buf), "JP V0, 0x%03X", nnn); break;
        case Op::RND:       std::snprintf(buf, sizeof(buf), "RND V%X, 0x%02X", x, nn); break;
        case Op::DRW:       std::snprintf(buf, sizeof(buf), "DRW V%X, V%X, %u", x, y, n); break;
        case Op::SKP:       std::snprintf(buf, sizeof(buf), "SKP V%X", x); break;
        case Op::SKNP:      std::snprintf(buf, sizeof(buf), "SKNP V%X", x); break;
        case Op::LD_VX_DT:  std::snprintf(buf, sizeof(buf), "LD V%X, DT", x); break;
        case Op::LD_VX_K:   std::snprintf(buf, sizeof(buf), "LD V%X, K", x); break;
        case Op::LD_DT_VX:  std::snprintf(buf, sizeof(buf), "LD DT, V%X", x); break;
        case Op::LD_ST_VX:  std::snprintf(buf, sizeof(buf), "LD ST, V%X", x); break;
        case Op::ADD_I_VX:  std::snprintf(buf, sizeof(buf), "ADD I, V%X", x); break;
        case Op::LD_F_VX:   std::snprintf(buf, sizeof(buf), "LD F, V%X", x); break;
        case Op::LD_B_VX:   std::snprintf(buf, sizeof(buf), "LD B, V%X", x); break;
        case Op::LD_MEM_VX: std::snprintf(buf, sizeof(buf), "LD [I], V%X", x); break;
        case Op::LD_VX_MEM: std::snprintf(buf, sizeof(buf), "LD V%X, [I]", x); break;
        case Op::UNKNOWN:   std::snprintf(buf, sizeof(buf), "DW 0x%04X",
                                          static_cast<unsigned>(ins.raw)); break;
    }
    return buf;
}
