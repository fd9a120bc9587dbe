#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace pw::bench {

// Private directory of non-compressible files, removed on destruction.
class TestFileSet {
public:
    TestFileSet(const std::filesystem::path& workDir, unsigned int count, unsigned int sizeMb);
    ~TestFileSet();

    TestFileSet(const TestFileSet&) = delete;
    TestFileSet& operator=(const TestFileSet&) = delete;

    [[nodiscard]] const std::vector<std::filesystem::path>& files() const { return files_; }
    [[nodiscard]] std::vector<std::string> fileArgs() const;
    [[nodiscard]] uint64_t totalBytes() const { return totalBytes_; }
    [[nodiscard]] const std::filesystem::path& directory() const { return dir_; }

private:
    std::filesystem::path dir_;
    std::vector<std::filesystem::path> files_;
    uint64_t totalBytes_{0};

    static void writeRandomFile(const std::filesystem::path& path, uint64_t bytes);
};

}
