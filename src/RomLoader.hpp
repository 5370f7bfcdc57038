#pragma once
#include <string>
#include <vector>
#include <cstdint>

class Machine;

// Locates a Chip-8 program on disk, reads it, and hands the bytes to the
// Machine.  Every failure throws RomLoadError before execution begins.
class RomLoader {
public:
    static constexpr const char* ROM_DIR = "roms";

    // Resolve a --rom argument: an existing path is used as-is; otherwise
    // the name is matched (case-insensitive prefix) against .ch8/.c8 files
    // in ROM_DIR.  Returns "" if nothing matches.
    static std::string find_rom(const std::string& name);

    // Read the whole file.  Rejects missing, empty and oversize images.
    static std::vector<uint8_t> read_rom(const std::string& path);

    // find_rom + read_rom + Machine::load_rom.  Returns the resolved path.
    static std::string load(const std::string& name, Machine& machine);

private:
    static std::string file_ext(const std::string& path);
};
