/**
 * @file test_chip8.cpp
 * @brief Opcode-level tests for the Chip8 execution engine.
 */

#include <gtest/gtest.h>
#include "cpu/chip8.hpp"
#include "system/Faults.hpp"
#include "system/Machine.hpp"
#include <initializer_list>
#include <string>
#include <vector>

class Chip8Test : public ::testing::Test {
protected:
    Machine m;
    Chip8   cpu{m};

    // Load big-endian 16-bit words at 0x200.
    void load(std::initializer_list<uint16_t> words) {
        std::vector<uint8_t> bytes;
        for (uint16_t w : words) {
            bytes.push_back(static_cast<uint8_t>(w >> 8));
            bytes.push_back(static_cast<uint8_t>(w & 0xFF));
        }
        m.load_rom(bytes);
    }

    void run(int steps) {
        for (int i = 0; i < steps; i++) cpu.step();
    }

    uint8_t V(uint8_t x) const { return m.get_register(x); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Fetch / PC advance
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(Chip8Test, LoadAndAddScenario) {
    load({0x6005, 0x7003});
    run(2);
    EXPECT_EQ(V(0), 8);
    EXPECT_EQ(m.get_pc(), 0x204);
}

TEST_F(Chip8Test, StepReportsExecuted) {
    load({0x6001});
    EXPECT_EQ(cpu.step(), StepResult::EXECUTED);
    EXPECT_EQ(cpu.instruction_count(), 1u);
    EXPECT_EQ(cpu.last_pc(), 0x200);
    EXPECT_EQ(cpu.last_instruction().op, Op::LD_VX_NN);
}

TEST_F(Chip8Test, FetchPastEndOfMemoryFaults) {
    m.set_pc(0xFFF);
    EXPECT_THROW(cpu.step(), VmFault);
}

// ─────────────────────────────────────────────────────────────────────────────
// Flow control
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(Chip8Test, JumpSetsPcDirectly) {
    load({0x1300});
    run(1);
    EXPECT_EQ(m.get_pc(), 0x300);
}

TEST_F(Chip8Test, CallPushesReturnAddressAndRetPopsIt) {
    load({0x2204,    // 0x200: CALL 0x204
          0x6001,    // 0x202: V0 = 1
          0x00EE});  // 0x204: RET
    run(1);
    EXPECT_EQ(m.get_pc(), 0x204);
    EXPECT_EQ(m.stack_depth(), 1);
    run(1);
    EXPECT_EQ(m.get_pc(), 0x202);
    EXPECT_EQ(m.stack_depth(), 0);
    run(1);
    EXPECT_EQ(V(0), 1);
}

TEST_F(Chip8Test, ReturnWithEmptyStackIsFatal) {
    load({0x00EE});
    try {
        cpu.step();
        FAIL() << "expected VmFault";
    } catch (const VmFault& e) {
        EXPECT_TRUE(e.has_context());
        EXPECT_EQ(e.pc(), 0x200);
        EXPECT_EQ(e.opcode(), 0x00EE);
        std::string msg = e.what();
        EXPECT_NE(msg.find("underflow"), std::string::npos);
        EXPECT_NE(msg.find("PC=0x0200"), std::string::npos);
        EXPECT_NE(msg.find("opcode=0x00EE"), std::string::npos);
    }
}

TEST_F(Chip8Test, RecursiveCallOverflowsOnSeventeenthPush) {
    load({0x2200});
    run(16);
    EXPECT_EQ(m.stack_depth(), 16);
    EXPECT_THROW(cpu.step(), VmFault);
}

TEST_F(Chip8Test, JumpWithV0Offset) {
    load({0x6004, 0xB300});
    run(2);
    EXPECT_EQ(m.get_pc(), 0x304);
}

TEST_F(Chip8Test, SelfJumpIsReportedAsSpinning) {
    load({0x6001, 0x1202});
    run(1);
    EXPECT_FALSE(cpu.is_spinning());
    run(1);
    EXPECT_TRUE(cpu.is_spinning());
    EXPECT_EQ(m.get_pc(), 0x202);
}

// ─────────────────────────────────────────────────────────────────────────────
// Conditional skips
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(Chip8Test, SkipIfEqualImmediate) {
    load({0x6042, 0x3042});
    run(2);
    EXPECT_EQ(m.get_pc(), 0x206);
}

TEST_F(Chip8Test, NoSkipIfEqualImmediateMismatch) {
    load({0x6042, 0x3041});
    run(2);
    EXPECT_EQ(m.get_pc(), 0x204);
}

TEST_F(Chip8Test, SkipIfNotEqualImmediate) {
    load({0x6042, 0x4041});
    run(2);
    EXPECT_EQ(m.get_pc(), 0x206);
}

TEST_F(Chip8Test, SkipIfRegistersEqual) {
    load({0x6007, 0x6107, 0x5010});
    run(3);
    EXPECT_EQ(m.get_pc(), 0x208);
}

TEST_F(Chip8Test, SkipIfRegistersDiffer) {
    load({0x6007, 0x6108, 0x9010, 0x5010});
    run(3);
    EXPECT_EQ(m.get_pc(), 0x208);
}

TEST_F(Chip8Test, SkipOnKeyDownAndUp) {
    load({0x6005, 0xE09E, 0x0000, 0xE0A1});
    m.set_key(5, true);
    run(2);
    EXPECT_EQ(m.get_pc(), 0x206);
    run(1);   // EXA1 with the key held: no skip
    EXPECT_EQ(m.get_pc(), 0x208);
}

TEST_F(Chip8Test, KeySkipUsesLowNibbleOfVx) {
    load({0x6013, 0xE09E});
    m.set_key(3, true);
    run(2);
    EXPECT_EQ(m.get_pc(), 0x206);
}

// ─────────────────────────────────────────────────────────────────────────────
// Immediate & register ALU
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(Chip8Test, AddImmediateWrapsWithoutTouchingVF) {
    load({0x6F07, 0x60FF, 0x7002});
    run(3);
    EXPECT_EQ(V(0), 0x01);
    EXPECT_EQ(V(0xF), 0x07);
}

TEST_F(Chip8Test, LogicOps) {
    load({0x60F0, 0x613C, 0x8200, 0x8211,   // V2 = V0 | V1
          0x8300, 0x8312,                   // V3 = V0 & V1
          0x8400, 0x8413});                 // V4 = V0 ^ V1
    run(8);
    EXPECT_EQ(V(2), 0xFC);
    EXPECT_EQ(V(3), 0x30);
    EXPECT_EQ(V(4), 0xCC);
}

TEST_F(Chip8Test, AddRegistersSetsCarry) {
    load({0x60F0, 0x6120, 0x8014});
    run(3);
    EXPECT_EQ(V(0), 0x10);
    EXPECT_EQ(V(0xF), 1);
}

TEST_F(Chip8Test, AddRegistersClearsCarry) {
    load({0x6F01, 0x6010, 0x6120, 0x8014});
    run(4);
    EXPECT_EQ(V(0), 0x30);
    EXPECT_EQ(V(0xF), 0);
}

TEST_F(Chip8Test, AddIntoVFKeepsFlag) {
    load({0x6FF0, 0x6120, 0x8F14});
    run(3);
    EXPECT_EQ(V(0xF), 1);
}

TEST_F(Chip8Test, SubtractNoBorrow) {
    load({0x6005, 0x6103, 0x8015});
    run(3);
    EXPECT_EQ(V(0), 2);
    EXPECT_EQ(V(0xF), 1);
}

TEST_F(Chip8Test, SubtractWithBorrow) {
    load({0x6003, 0x6105, 0x8015});
    run(3);
    EXPECT_EQ(V(0), 0xFE);
    EXPECT_EQ(V(0xF), 0);
}

TEST_F(Chip8Test, SubtractEqualOperandsIsNoBorrow) {
    load({0x6009, 0x6109, 0x8015});
    run(3);
    EXPECT_EQ(V(0), 0);
    EXPECT_EQ(V(0xF), 1);
}

TEST_F(Chip8Test, ReverseSubtract) {
    load({0x6003, 0x6105, 0x8017});
    run(3);
    EXPECT_EQ(V(0), 2);
    EXPECT_EQ(V(0xF), 1);
}

TEST_F(Chip8Test, ReverseSubtractWithBorrow) {
    load({0x6005, 0x6103, 0x8017});
    run(3);
    EXPECT_EQ(V(0), 0xFE);
    EXPECT_EQ(V(0xF), 0);
}

TEST_F(Chip8Test, SubtractIntoVFKeepsFlag) {
    load({0x6F05, 0x6103, 0x8F15});
    run(3);
    EXPECT_EQ(V(0xF), 1);
}

TEST_F(Chip8Test, ShiftRightUsesVxByDefault) {
    load({0x6005, 0x6180, 0x8016});
    run(3);
    EXPECT_EQ(V(0), 0x02);
    EXPECT_EQ(V(0xF), 1);
}

TEST_F(Chip8Test, ShiftRightReadsVyWithQuirk) {
    cpu.set_quirks(Quirks{true, false});
    load({0x6005, 0x6180, 0x8016});
    run(3);
    EXPECT_EQ(V(0), 0x40);
    EXPECT_EQ(V(0xF), 0);
}

TEST_F(Chip8Test, ShiftLeftCarriesMsb) {
    load({0x6081, 0x800E});
    run(2);
    EXPECT_EQ(V(0), 0x02);
    EXPECT_EQ(V(0xF), 1);
}

TEST_F(Chip8Test, ShiftLeftIntoVFKeepsFlag) {
    load({0x6F81, 0x8FFE});
    run(2);
    EXPECT_EQ(V(0xF), 1);
}

TEST_F(Chip8Test, ShiftRightIntoVFKeepsFlag) {
    load({0x6F02, 0x8FF6});
    run(2);
    EXPECT_EQ(V(0xF), 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Index register, random, draw
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(Chip8Test, LoadIndex) {
    load({0xA123});
    run(1);
    EXPECT_EQ(m.get_index(), 0x123);
}

TEST_F(Chip8Test, RandomIsMaskedByNN) {
    load({0x60FF, 0xC000, 0xC10F});
    run(3);
    EXPECT_EQ(V(0), 0);
    EXPECT_LE(V(1), 0x0F);
}

TEST_F(Chip8Test, RandomIsReproducibleForASeed) {
    Machine m2;
    Chip8 a(m, Quirks{}, UnknownOpcodePolicy::HALT, 1234);
    Chip8 b(m2, Quirks{}, UnknownOpcodePolicy::HALT, 1234);
    std::vector<uint8_t> rom = {0xC0, 0xFF, 0xC1, 0xFF, 0xC2, 0xFF};
    m.load_rom(rom);
    m2.load_rom(rom);
    for (int i = 0; i < 3; i++) { a.step(); b.step(); }
    for (uint8_t r = 0; r < 3; r++)
        EXPECT_EQ(m.get_register(r), m2.get_register(r));
}

TEST_F(Chip8Test, DrawSetsCollisionFlag) {
    load({0x600A,    // 0x200
          0x6105,    // 0x202
          0xA20A,    // 0x204: I = sprite
          0xD013,    // 0x206
          0xD013,    // 0x208
          0xF090,    // 0x20A: sprite rows F0 90 F0
          0xF000});
    run(4);
    EXPECT_EQ(V(0xF), 0);
    EXPECT_TRUE(m.get_pixel(10, 5));
    EXPECT_TRUE(m.get_pixel(13, 6));
    run(1);
    EXPECT_EQ(V(0xF), 1);
    EXPECT_FALSE(m.get_pixel(10, 5));
}

TEST_F(Chip8Test, ClearScreen) {
    load({0xA050, 0xD005, 0x00E0});
    run(2);
    EXPECT_TRUE(m.get_pixel(0, 0));
    run(1);
    EXPECT_FALSE(m.get_pixel(0, 0));
}

// ─────────────────────────────────────────────────────────────────────────────
// Timers
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(Chip8Test, TimerLoadAndRead) {
    load({0x6020, 0xF015, 0xF018, 0xF107});
    run(3);
    EXPECT_EQ(m.get_delay_timer(), 0x20);
    EXPECT_EQ(m.get_sound_timer(), 0x20);
    cpu.tick_timers();
    run(1);
    EXPECT_EQ(V(1), 0x1F);
    EXPECT_EQ(m.get_sound_timer(), 0x1F);
}

TEST_F(Chip8Test, TimersDoNotDecayPerInstruction) {
    load({0x6030, 0xF015, 0x6001, 0x6002, 0x6003});
    run(5);
    EXPECT_EQ(m.get_delay_timer(), 0x30);
}

// ─────────────────────────────────────────────────────────────────────────────
// Key wait (FX0A)
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(Chip8Test, KeyWaitHoldsPcUntilKeyGoesDown) {
    load({0xF30A, 0x6001});
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(cpu.step(), StepResult::AWAITING_KEY);
        EXPECT_EQ(m.get_pc(), 0x200);
    }
    m.set_key(0xB, true);
    EXPECT_EQ(cpu.step(), StepResult::EXECUTED);
    EXPECT_EQ(V(3), 0xB);
    EXPECT_EQ(m.get_pc(), 0x202);
    run(1);
    EXPECT_EQ(V(0), 1);
}

TEST_F(Chip8Test, KeyWaitIgnoresKeyHeldBeforehand) {
    load({0xF00A});
    m.set_key(2, true);
    EXPECT_EQ(cpu.step(), StepResult::AWAITING_KEY);
    EXPECT_EQ(cpu.step(), StepResult::AWAITING_KEY);
    m.set_key(2, false);
    EXPECT_EQ(cpu.step(), StepResult::AWAITING_KEY);
    m.set_key(2, true);
    EXPECT_EQ(cpu.step(), StepResult::EXECUTED);
    EXPECT_EQ(V(0), 2);
}

TEST_F(Chip8Test, TimersKeepRunningDuringKeyWait) {
    load({0x6005, 0xF015, 0xF00A});
    run(3);
    ASSERT_TRUE(m.is_awaiting_key());
    cpu.tick_timers();
    cpu.tick_timers();
    EXPECT_EQ(m.get_delay_timer(), 3);
}

// ─────────────────────────────────────────────────────────────────────────────
// FXnn index / memory
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(Chip8Test, AddToIndexLeavesVFAlone) {
    load({0x6F07, 0xA0FF, 0x6002, 0xF01E});
    run(4);
    EXPECT_EQ(m.get_index(), 0x101);
    EXPECT_EQ(V(0xF), 0x07);
}

TEST_F(Chip8Test, AddToIndexWrapsAt12Bits) {
    load({0xAFFF, 0x6002, 0xF01E});
    run(3);
    EXPECT_EQ(m.get_index(), 0x001);
}

TEST_F(Chip8Test, FontGlyphAddress) {
    load({0x600A, 0xF029});
    run(2);
    EXPECT_EQ(m.get_index(), FONT_START + 5 * 0xA);
    EXPECT_EQ(m.read_byte(m.get_index()), 0xF0);
    EXPECT_EQ(m.read_byte(m.get_index() + 4), 0x90);
}

TEST_F(Chip8Test, BinaryCodedDecimal) {
    load({0x60FE, 0xA300, 0xF033});
    run(3);
    EXPECT_EQ(m.read_byte(0x300), 2);
    EXPECT_EQ(m.read_byte(0x301), 5);
    EXPECT_EQ(m.read_byte(0x302), 4);
}

TEST_F(Chip8Test, StoreAndLoadRegisters) {
    load({0x6011, 0x6122, 0x6233, 0x63FF, 0xA300, 0xF255,
          0x6000, 0x6100, 0x6200, 0xF265});
    run(6);
    EXPECT_EQ(m.read_byte(0x300), 0x11);
    EXPECT_EQ(m.read_byte(0x301), 0x22);
    EXPECT_EQ(m.read_byte(0x302), 0x33);
    EXPECT_EQ(m.read_byte(0x303), 0x00);   // V3 is past X
    EXPECT_EQ(m.get_index(), 0x300);
    run(4);
    EXPECT_EQ(V(0), 0x11);
    EXPECT_EQ(V(1), 0x22);
    EXPECT_EQ(V(2), 0x33);
    EXPECT_EQ(V(3), 0xFF);
    EXPECT_EQ(m.get_index(), 0x300);
}

TEST_F(Chip8Test, StoreAdvancesIndexWithQuirk) {
    cpu.set_quirks(Quirks{false, true});
    load({0xA300, 0xF255});
    run(2);
    EXPECT_EQ(m.get_index(), 0x303);
}

TEST_F(Chip8Test, StoreIntoInterpreterAreaIsFatal) {
    load({0xA100, 0xF055});
    run(1);
    EXPECT_THROW(cpu.step(), VmFault);
}

TEST_F(Chip8Test, LoadPastEndOfMemoryIsFatal) {
    load({0xAFFE, 0xF265});
    run(1);
    try {
        cpu.step();
        FAIL() << "expected VmFault";
    } catch (const VmFault& e) {
        EXPECT_EQ(e.pc(), 0x202);
        EXPECT_EQ(e.opcode(), 0xF265);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Unknown opcodes
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(Chip8Test, UnknownOpcodeHaltsByDefault) {
    load({0x0123});
    try {
        cpu.step();
        FAIL() << "expected VmFault";
    } catch (const VmFault& e) {
        EXPECT_EQ(e.reason(), "unknown opcode");
        EXPECT_EQ(e.opcode(), 0x0123);
        EXPECT_EQ(e.pc(), 0x200);
    }
}

TEST_F(Chip8Test, UnknownOpcodeSkippedUnderSkipPolicy) {
    cpu.set_unknown_policy(UnknownOpcodePolicy::SKIP);
    load({0x0123, 0x5121, 0x6001});
    EXPECT_EQ(cpu.step(), StepResult::SKIPPED);
    EXPECT_EQ(m.get_pc(), 0x202);
    EXPECT_EQ(cpu.step(), StepResult::SKIPPED);
    EXPECT_EQ(cpu.step(), StepResult::EXECUTED);
    EXPECT_EQ(V(0), 1);
}
