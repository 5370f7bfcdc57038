#pragma once
#include <array>
#include <cstdint>
#include <string>

class Machine;

struct TraceEntry {
    uint16_t pc, opcode, i;
    uint8_t  v[16];
    uint8_t  sp, dt, st;
    bool     waiting;
    uint64_t frame;
};

// Circular trace buffer.  Call record() before every Chip8::step() and
// dump() on a fault or at shutdown to write the history to a text file.
class Debugger {
public:
    static constexpr size_t BUF_SIZE = 500;

    // Snapshot the machine as it stands before the next instruction.
    void record(const Machine& machine, uint64_t frame);

    // Write the buffered instructions, oldest first.  Returns false if the
    // file could not be opened.
    bool dump(const std::string& path) const;

    bool   has_entries() const { return count_ > 0; }
    size_t size() const { return count_; }
    const TraceEntry& newest() const { return buf_[(head_ + BUF_SIZE - 1) % BUF_SIZE]; }

private:
    std::array<TraceEntry, BUF_SIZE> buf_{};
    size_t head_  = 0;
    size_t count_ = 0;
};
