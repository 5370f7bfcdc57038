/**
 * @file test_decoder.cpp
 * @brief Opcode decode and disassembly.
 */

#include <gtest/gtest.h>
#include "cpu/decoder.hpp"
#include <utility>
#include <vector>

TEST(DecoderTest, ExtractsFields) {
    Instruction ins = decode(0xD123);
    EXPECT_EQ(ins.op, Op::DRW);
    EXPECT_EQ(ins.raw, 0xD123);
    EXPECT_EQ(ins.x, 0x1);
    EXPECT_EQ(ins.y, 0x2);
    EXPECT_EQ(ins.n, 0x3);
    EXPECT_EQ(ins.nn, 0x23);
    EXPECT_EQ(ins.nnn, 0x123);
}

TEST(DecoderTest, EveryDocumentedPattern) {
    const std::vector<std::pair<uint16_t, Op>> table = {
        {0x00E0, Op::CLS},       {0x00EE, Op::RET},
        {0x1ABC, Op::JP},        {0x2ABC, Op::CALL},
        {0x3A12, Op::SE_VX_NN},  {0x4A12, Op::SNE_VX_NN},
        {0x5AB0, Op::SE_VX_VY},  {0x6A12, Op::LD_VX_NN},
        {0x7A12, Op::ADD_VX_NN}, {0x8AB0, Op::LD_VX_VY},
        {0x8AB1, Op::OR},        {0x8AB2, Op::AND},
        {0x8AB3, Op::XOR},       {0x8AB4, Op::ADD_VX_VY},
        {0x8AB5, Op::SUB},       {0x8AB6, Op::SHR},
        {0x8AB7, Op::SUBN},      {0x8ABE, Op::SHL},
        {0x9AB0, Op::SNE_VX_VY}, {0xAABC, Op::LD_I},
        {0xBABC, Op::JP_V0},     {0xCA12, Op::RND},
        {0xDAB5, Op::DRW},       {0xEA9E, Op::SKP},
        {0xEAA1, Op::SKNP},      {0xFA07, Op::LD_VX_DT},
        {0xFA0A, Op::LD_VX_K},   {0xFA15, Op::LD_DT_VX},
        {0xFA18, Op::LD_ST_VX},  {0xFA1E, Op::ADD_I_VX},
        {0xFA29, Op::LD_F_VX},   {0xFA33, Op::LD_B_VX},
        {0xFA55, Op::LD_MEM_VX}, {0xFA65, Op::LD_VX_MEM},
    };
    for (const auto& entry : table)
        EXPECT_EQ(decode(entry.first).op, entry.second) << std::hex << entry.first;
}

TEST(DecoderTest, MalformedAndExtendedPatternsAreUnknown) {
    const uint16_t unknown[] = {
        0x0000, 0x0123, 0x00FF, 0x00FE, 0x00C1,   // machine-code calls / SCHIP
        0x5AB1, 0x9AB7,
        0x8AB8, 0x8ABF,
        0xEA00, 0xEA9F,
        0xFA00, 0xFA30, 0xFA75, 0xFAFF,
    };
    for (uint16_t op : unknown)
        EXPECT_EQ(decode(op).op, Op::UNKNOWN) << std::hex << op;
}

TEST(DecoderTest, Disassembly) {
    EXPECT_EQ(disassemble(decode(0x00E0)), "CLS");
    EXPECT_EQ(disassemble(decode(0x1ABC)), "JP 0xABC");
    EXPECT_EQ(disassemble(decode(0x8124)), "ADD V1, V2");
    EXPECT_EQ(disassemble(decode(0x6A0F)), "LD VA, 0x0F");
    EXPECT_EQ(disassemble(decode(0xD125)), "DRW V1, V2, 5");
    EXPECT_EQ(disassemble(decode(0xF30A)), "LD V3, K");
    EXPECT_EQ(disassemble(decode(0xF255)), "LD [I], V2");
    EXPECT_EQ(disassemble(decode(0x0123)), "DW 0x0123");
}
