//===----------------------------------------------------------------------===//
// Part of the screeps-build project, under the GNU GPL v3.
//===----------------------------------------------------------------------===//
// File: tests/common/TempDir.hpp
// Purpose: Scratch directories and small file helpers for filesystem tests.
// Key invariants: Each TempDir is unique per process and removed on destruction.
//===----------------------------------------------------------------------===//
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <unistd.h>

namespace screeps::test
{

class TempDir
{
  public:
    TempDir()
    {
        static std::atomic<unsigned> counter{0};
        const auto name = "screeps_build_test_" + std::to_string(::getpid()) + "_" +
                          std::to_string(counter.fetch_add(1));
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
        path_ = std::filesystem::canonical(path_);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path &path() const
    {
        return path_;
    }

  private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path &path, const std::string &content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace screeps::test
