// src/cpu/chip8.cpp
#include "chip8.hpp"
#include "../system/Faults.hpp"
#include "../system/Machine.hpp"
#include <cstdio>

Chip8::Chip8(Machine& mach, Quirks quirks, UnknownOpcodePolicy policy, uint32_t rng_seed)
    : machine(mach), quirks_(quirks), policy_(policy), rng_(rng_seed) {}

void Chip8::tick_timers() {
    machine.tick_timers();
}

// ============================================================================
// MAIN EXECUTION STEP
// ============================================================================
StepResult Chip8::step() {
    // FX0A parks the CPU: PC stays on the FX0A until a key goes down.
    if (machine.is_awaiting_key()) {
        uint8_t key = 0;
        if (!machine.take_pressed_key(key))
            return StepResult::AWAITING_KEY;
        machine.set_register(machine.key_wait_register(), key);
        machine.set_pc(static_cast<uint16_t>(machine.get_pc() + 2));
        executed_++;
        return StepResult::EXECUTED;
    }

    const uint16_t pc = machine.get_pc();
    uint16_t opcode = 0;
    try {
        opcode = machine.read_word(pc);
        Instruction ins = decode(opcode);
        last_    = ins;
        last_pc_ = pc;

        // PC points at the next instruction while the opcode executes.
        machine.set_pc(static_cast<uint16_t>(pc + 2));

        if (ins.op == Op::UNKNOWN) {
            op_unknown(ins);
            spinning_ = false;
            return StepResult::SKIPPED;
        }
        execute(ins, pc);
        if (machine.is_awaiting_key())
            return StepResult::AWAITING_KEY;
    } catch (VmFault& e) {
        if (!e.has_context()) e.set_context(pc, opcode);
        throw;
    }

    executed_++;
    return StepResult::EXECUTED;
}

void Chip8::skip_if(bool cond) {
    if (cond) machine.set_pc(static_cast<uint16_t>(machine.get_pc() + 2));
}

// ============================================================================
// DISPATCH
// ============================================================================
void Chip8::execute(const Instruction& ins, uint16_t ins_pc) {
    const uint8_t x = ins.x;
    const uint8_t y = ins.y;
    spinning_ = false;

    switch (ins.op) {
        case Op::CLS:
            machine.clear_framebuffer();
            break;
        case Op::RET:
            machine.set_pc(machine.pop());
            break;
        case Op::JP:
            spinning_ = (ins.nnn == ins_pc);
            machine.set_pc(ins.nnn);
            break;
        case Op::CALL:
            machine.push(machine.get_pc());
            machine.set_pc(ins.nnn);
            break;
        case Op::SE_VX_NN:
            skip_if(machine.get_register(x) == ins.nn);
            break;
        case Op::SNE_VX_NN:
            skip_if(machine.get_register(x) != ins.nn);
            break;
        case Op::SE_VX_VY:
            skip_if(machine.get_register(x) == machine.get_register(y));
            break;
        case Op::SNE_VX_VY:
            skip_if(machine.get_register(x) != machine.get_register(y));
            break;
        case Op::LD_VX_NN:
            machine.set_register(x, ins.nn);
            break;
        case Op::ADD_VX_NN:
            // Wraps; VF untouched
            machine.set_register(x, static_cast<uint8_t>(machine.get_register(x) + ins.nn));
            break;

        // ── 8XYn register ALU ──────────────────────────────────────────
        case Op::LD_VX_VY:
            machine.set_register(x, machine.get_register(y));
            break;
        case Op::OR:
            machine.set_register(x, machine.get_register(x) | machine.get_register(y));
            break;
        case Op::AND:
            machine.set_register(x, machine.get_register(x) & machine.get_register(y));
            break;
        case Op::XOR:
            machine.set_register(x, machine.get_register(x) ^ machine.get_register(y));
            break;
        case Op::ADD_VX_VY:
            op_add(x, y);
            break;
        case Op::SUB:
            op_sub(x, machine.get_register(x), machine.get_register(y));
            break;
        case Op::SUBN:
            op_sub(x, machine.get_register(y), machine.get_register(x));
            break;
        case Op::SHR:
            op_shr(x, y);
            break;
        case Op::SHL:
            op_shl(x, y);
            break;

        case Op::LD_I:
            machine.set_index(ins.nnn);
            break;
        case Op::JP_V0:
            machine.set_pc(static_cast<uint16_t>((ins.nnn + machine.get_register(0)) & 0x0FFF));
            break;
        case Op::RND: {
            std::uniform_int_distribution<int> dist(0, 255);
            machine.set_register(x, static_cast<uint8_t>(dist(rng_) & ins.nn));
            break;
        }
        case Op::DRW: {
            bool collided = machine.draw_sprite(machine.get_register(x),
                                                machine.get_register(y), ins.n);
            machine.set_register(FLAG_REGISTER, collided ? 1 : 0);
            break;
        }
        case Op::SKP:
            skip_if(machine.is_key_down(machine.get_register(x) & 0x0F));
            break;
        case Op::SKNP:
            skip_if(!machine.is_key_down(machine.get_register(x) & 0x0F));
            break;

        // ── FXnn timers / index / memory ───────────────────────────────
        case Op::LD_VX_DT:
            machine.set_register(x, machine.get_delay_timer());
            break;
        case Op::LD_DT_VX:
            machine.set_delay_timer(machine.get_register(x));
            break;
        case Op::LD_ST_VX:
            machine.set_sound_timer(machine.get_register(x));
            break;
        case Op::LD_VX_K:
            // Rewind onto the FX0A; step() resumes past it once a key lands.
            machine.set_pc(ins_pc);
            machine.begin_key_wait(x);
            break;
        case Op::ADD_I_VX:
            // No VF side effect
            machine.set_index(static_cast<uint16_t>((machine.get_index() + machine.get_register(x)) & 0x0FFF));
            break;
        case Op::LD_F_VX:
            machine.set_index(static_cast<uint16_t>(FONT_START + 5 * (machine.get_register(x) & 0x0F)));
            break;
        case Op::LD_B_VX:
            op_bcd(x);
            break;
        case Op::LD_MEM_VX:
            op_store(x);
            break;
        case Op::LD_VX_MEM:
            op_load(x);
            break;

        case Op::UNKNOWN:
            op_unknown(ins);
            break;
    }
}

// ============================================================================
// ARITHMETIC OPERATIONS
// ============================================================================
void Chip8::op_add(uint8_t x, uint8_t y) {
    uint16_t sum = machine.get_register(x) + machine.get_register(y);
    machine.set_register(x, static_cast<uint8_t>(sum & 0xFF));
    machine.set_register(FLAG_REGISTER, sum > 0xFF ? 1 : 0);
}

// VF = 1 when no borrow (minuend >= subtrahend).
void Chip8::op_sub(uint8_t x, uint8_t minuend, uint8_t subtrahend) {
    machine.set_register(x, static_cast<uint8_t>(minuend - subtrahend));
    machine.set_register(FLAG_REGISTER, minuend >= subtrahend ? 1 : 0);
}

void Chip8::op_shr(uint8_t x, uint8_t y) {
    uint8_t src = machine.get_register(quirks_.shift_uses_vy ? y : x);
    machine.set_register(x, static_cast<uint8_t>(src >> 1));
    machine.set_register(FLAG_REGISTER, src & 0x01);
}

void Chip8::op_shl(uint8_t x, uint8_t y) {
    uint8_t src = machine.get_register(quirks_.shift_uses_vy ? y : x);
    machine.set_register(x, static_cast<uint8_t>(src << 1));
    machine.set_register(FLAG_REGISTER, (src >> 7) & 0x01);
}

// ============================================================================
// MEMORY OPERATIONS
// ============================================================================
void Chip8::op_bcd(uint8_t x) {
    uint8_t  val = machine.get_register(x);
    uint16_t i   = machine.get_index();
    machine.write_byte(i,                             val / 100);
    machine.write_byte(static_cast<uint16_t>(i + 1), (val / 10) % 10);
    machine.write_byte(static_cast<uint16_t>(i + 2), val % 10);
}

void Chip8::op_store(uint8_t x) {
    uint16_t i = machine.get_index();
    for (uint8_t r = 0; r <= x; r++)
        machine.write_byte(static_cast<uint16_t>(i + r), machine.get_register(r));
    if (quirks_.load_store_increments_i)
        machine.set_index(static_cast<uint16_t>(i + x + 1));
}

void Chip8::op_load(uint8_t x) {
    uint16_t i = machine.get_index();
    for (uint8_t r = 0; r <= x; r++)
        machine.set_register(r, machine.read_byte(static_cast<uint16_t>(i + r)));
    if (quirks_.load_store_increments_i)
        machine.set_index(static_cast<uint16_t>(i + x + 1));
}

void Chip8::op_unknown(const Instruction& ins) {
    if (policy_ == UnknownOpcodePolicy::HALT)
        throw VmFault("unknown opcode");

    // SKIP: PC already advanced past it.  Report each distinct opcode once.
    if (reported_unknown_.insert(ins.raw).second) {
        std::fprintf(stderr, "[CPU] Unknown opcode 0x%04X at 0x%03X, skipping\n",
                     static_cast<unsigned>(ins.raw), static_cast<unsigned>(last_pc_));
    }
}
