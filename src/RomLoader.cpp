#include "RomLoader.hpp"
#include "system/Faults.hpp"
#include "system/Machine.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

std::string RomLoader::file_ext(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string RomLoader::find_rom(const std::string& name) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!name.empty() && fs::is_regular_file(name, ec)) return name;

    std::cout << "[ROM] Searching " << ROM_DIR << "/ for: '" << name << "'\n";
    if (!fs::is_directory(ROM_DIR, ec)) return "";

    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::vector<std::string> matches;
    for (auto& e : fs::directory_iterator(ROM_DIR, ec)) {
        if (!e.is_regular_file()) continue;
        std::string ext = file_ext(e.path().string());
        if (ext != ".ch8" && ext != ".c8") continue;
        std::string stem = e.path().stem().string();
        std::transform(stem.begin(), stem.end(), stem.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower.empty() || stem.find(lower) == 0)
            matches.push_back(e.path().string());
    }
    if (matches.empty()) {
        std::cout << "[ROM] No match found for: '" << name << "'\n";
        return "";
    }
    std::sort(matches.begin(), matches.end());
    std::cout << "[ROM] Picking: '" << matches.front() << "'\n";
    return matches.front();
}

std::vector<uint8_t> RomLoader::read_rom(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw RomLoadError("Failed to open ROM file: " + path);

    std::vector<uint8_t> buf((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
    if (file.bad())
        throw RomLoadError("Read error on ROM file: " + path);
    if (buf.empty())
        throw RomLoadError("ROM file is empty: " + path);
    if (buf.size() > MAX_ROM_SIZE)
        throw RomLoadError("ROM too large for memory map: " + path + " (" +
                           std::to_string(buf.size()) + " bytes, max " +
                           std::to_string(MAX_ROM_SIZE) + ")");
    return buf;
}

std::string RomLoader::load(const std::string& name, Machine& machine) {
    std::string path = find_rom(name);
    if (path.empty())
        throw RomLoadError("No ROM found matching: " + name);

    std::vector<uint8_t> bytes = read_rom(path);
    machine.load_rom(bytes);
    std::cout << "[ROM] Loaded " << path << " (" << bytes.size()
              << " bytes) at 0x" << std::hex << PROGRAM_START << std::dec << "\n";
    return path;
}
