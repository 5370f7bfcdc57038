/**
 * @file test_rom_loader.cpp
 * @brief ROM file loading and size validation.
 */

#include <gtest/gtest.h>
#include "RomLoader.hpp"
#include "system/Faults.hpp"
#include "system/Machine.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class RomLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("chip8vm_rom_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::vector<uint8_t>& bytes) {
        fs::path p = dir_ / name;
        std::ofstream out(p, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        return p.string();
    }

    fs::path dir_;
};

TEST_F(RomLoaderTest, ReadsWholeFile) {
    std::string path = write_file("pong.ch8", {0x60, 0x05, 0x70, 0x03});
    std::vector<uint8_t> bytes = RomLoader::read_rom(path);
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0x60);
    EXPECT_EQ(bytes[3], 0x03);
}

TEST_F(RomLoaderTest, MissingFileThrows) {
    EXPECT_THROW(RomLoader::read_rom((dir_ / "nope.ch8").string()), RomLoadError);
}

TEST_F(RomLoaderTest, EmptyFileThrows) {
    std::string path = write_file("empty.ch8", {});
    EXPECT_THROW(RomLoader::read_rom(path), RomLoadError);
}

TEST_F(RomLoaderTest, OversizeFileThrows) {
    std::string path = write_file("big.ch8", std::vector<uint8_t>(MAX_ROM_SIZE + 1, 0x00));
    EXPECT_THROW(RomLoader::read_rom(path), RomLoadError);
}

TEST_F(RomLoaderTest, MaxSizeFileLoads) {
    std::string path = write_file("full.ch8", std::vector<uint8_t>(MAX_ROM_SIZE, 0x12));
    EXPECT_EQ(RomLoader::read_rom(path).size(), MAX_ROM_SIZE);
}

TEST_F(RomLoaderTest, LoadWritesIntoMachine) {
    std::string path = write_file("prog.ch8", {0xA2, 0x2A, 0x60, 0x0C});
    Machine m;
    EXPECT_EQ(RomLoader::load(path, m), path);
    EXPECT_EQ(m.read_word(0x200), 0xA22A);
    EXPECT_EQ(m.read_word(0x202), 0x600C);
}

TEST_F(RomLoaderTest, FindRomReturnsExistingPathUnchanged) {
    std::string path = write_file("maze.ch8", {0x00, 0xE0});
    EXPECT_EQ(RomLoader::find_rom(path), path);
}

TEST_F(RomLoaderTest, LoadOfUnknownNameThrows) {
    Machine m;
    EXPECT_THROW(RomLoader::load((dir_ / "does-not-exist").string(), m), RomLoadError);
}
