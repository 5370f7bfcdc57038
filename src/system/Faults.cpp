// src/system/Faults.cpp
#include "Faults.hpp"
#include <cstdio>

VmFault::VmFault(const std::string& reason)
    : std::runtime_error(reason), reason_(reason), message_(reason) {}

void VmFault::set_context(uint16_t pc, uint16_t opcode) {
    pc_          = pc;
    opcode_      = opcode;
    has_context_ = true;

    char where[48];
    std::snprintf(where, sizeof(where), " at PC=0x%04X opcode=0x%04X",
                  static_cast<unsigned>(pc), static_cast<unsigned>(opcode));
    message_ = reason_ + where;
}
