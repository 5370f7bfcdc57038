// src/cpu/chip8.hpp
#pragma once
#include <cstdint>
#include <random>
#include <unordered_set>
#include "decoder.hpp"

class Machine;

// Historically divergent opcode behaviours.  Defaults follow the modern
// interpreters most test ROMs target.
struct Quirks {
    bool shift_uses_vy          = false;  // 8XY6/8XYE: VX := VY >> 1 / << 1
    bool load_store_increments_i = false; // FX55/FX65: I += X + 1 afterwards
};

enum class UnknownOpcodePolicy { HALT, SKIP };

enum class StepResult {
    EXECUTED,       // one instruction applied
    AWAITING_KEY,   // FX0A pending, nothing executed
    SKIPPED,        // unknown opcode stepped over (SKIP policy)
};

// Fetch-decode-execute engine.  Holds no VM state of its own besides the
// RNG and diagnostics; everything lives in the Machine it drives.
class Chip8 {
public:
    explicit Chip8(Machine& machine, Quirks quirks = {},
                   UnknownOpcodePolicy policy = UnknownOpcodePolicy::HALT,
                   uint32_t rng_seed = 0);

    // Execute one instruction (or poll the key-wait).  Throws VmFault with
    // the failing PC and opcode attached.
    StepResult step();

    // 60Hz timer decay; forwards to Machine::tick_timers().
    void tick_timers();

    void set_quirks(const Quirks& q) { quirks_ = q; }
    const Quirks& get_quirks() const { return quirks_; }
    void set_unknown_policy(UnknownOpcodePolicy p) { policy_ = p; }
    UnknownOpcodePolicy get_unknown_policy() const { return policy_; }
    void seed(uint32_t s) { rng_.seed(s); }

    // Last decoded instruction and its address (for traces).
    const Instruction& last_instruction() const { return last_; }
    uint16_t last_pc() const { return last_pc_; }
    uint64_t instruction_count() const { return executed_; }

    // True once the program parks itself on "1NNN" jumping to its own
    // address, the usual way test ROMs signal completion.
    bool is_spinning() const { return spinning_; }

private:
    Machine&            machine;
    Quirks              quirks_;
    UnknownOpcodePolicy policy_;
    std::mt19937        rng_;

    Instruction last_{};
    uint16_t    last_pc_  = 0;
    uint64_t    executed_ = 0;
    bool        spinning_ = false;
    std::unordered_set<uint16_t> reported_unknown_;

    void execute(const Instruction& ins, uint16_t ins_pc);
    void skip_if(bool cond);

    // 8XYn helpers.  Each writes VX first and VF last so that the flag
    // survives when X == F.
    void op_add(uint8_t x, uint8_t y);
    void op_sub(uint8_t x, uint8_t minuend, uint8_t subtrahend);
    void op_shr(uint8_t x, uint8_t y);
    void op_shl(uint8_t x, uint8_t y);

    void op_bcd(uint8_t x);
    void op_store(uint8_t x);
    void op_load(uint8_t x);
    void op_unknown(const Instruction& ins);
};
