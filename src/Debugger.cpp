#include "Debugger.hpp"
#include "cpu/decoder.hpp"
#include "system/Machine.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>

void Debugger::record(const Machine& machine, uint64_t frame) {
    TraceEntry& te = buf_[head_];
    te.pc = machine.get_pc();
    // Side-effect-free fetch; a PC at the top of memory records 0x0000
    // and the fault itself is raised by the step that follows.
    te.opcode = (te.pc + 1 < MEMORY_SIZE) ? machine.read_word(te.pc) : 0x0000;
    te.i  = machine.get_index();
    for (uint8_t r = 0; r < REGISTER_COUNT; r++)
        te.v[r] = machine.get_register(r);
    te.sp      = machine.stack_depth();
    te.dt      = machine.get_delay_timer();
    te.st      = machine.get_sound_timer();
    te.waiting = machine.is_awaiting_key();
    te.frame   = frame;
    head_ = (head_ + 1) % BUF_SIZE;
    if (count_ < BUF_SIZE) count_++;
}

bool Debugger::dump(const std::string& path) const {
    if (count_ == 0) return true;

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "[TRACE] Could not open " << path << "\n";
        return false;
    }
    out << "# Chip8VM trace - last " << count_ << " instructions\n";
    out << "#  FRAME   PC  OP    I   SP DT ST  V0-VF                                            INSN\n";

    size_t start = (count_ < BUF_SIZE) ? 0 : head_;
    for (size_t n = 0; n < count_; n++) {
        const TraceEntry& e = buf_[(start + n) % BUF_SIZE];
        char regs[16 * 3 + 1];
        for (int r = 0; r < 16; r++)
            std::snprintf(regs + r * 3, 4, "%02X ", e.v[r]);

        std::string insn = e.waiting ? "(waiting for key)" : disassemble(decode(e.opcode));
        char line[160];
        std::snprintf(line, sizeof(line), "%8llu  %03X %04X  %03X  %2u %02X %02X  %s %s\n",
                      static_cast<unsigned long long>(e.frame),
                      e.pc, e.opcode, e.i,
                      static_cast<unsigned>(e.sp), e.dt, e.st,
                      regs, insn.c_str());
        out << line;
    }
    out.close();
    std::cerr << "[TRACE] Dumped " << count_ << " instructions to " << path << "\n";
    return true;
}
