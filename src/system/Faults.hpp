// src/system/Faults.hpp
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

// Unrecoverable machine fault: stack overflow/underflow, out-of-range
// memory access, write into interpreter memory, unknown opcode under the
// HALT policy.  The CPU attaches the failing PC and opcode before the
// fault leaves Chip8::step().
class VmFault : public std::runtime_error {
public:
    explicit VmFault(const std::string& reason);

    void set_context(uint16_t pc, uint16_t opcode);
    bool has_context() const { return has_context_; }
    uint16_t pc() const { return pc_; }
    uint16_t opcode() const { return opcode_; }
    const std::string& reason() const { return reason_; }

    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string reason_;
    std::string message_;
    uint16_t    pc_          = 0;
    uint16_t    opcode_      = 0;
    bool        has_context_ = false;
};

// ROM image rejected before execution started (missing, empty, too large).
class RomLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
