#include "bench/TestFileSet.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <random>
#include <stdexcept>

using namespace pw::bench;

namespace {

constexpr uint64_t MiB = 1024 * 1024;
constexpr char ALPHABET[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

}

TestFileSet::TestFileSet(const std::filesystem::path& workDir, const unsigned int count, const unsigned int sizeMb) {
    if (count == 0 || sizeMb == 0) throw std::invalid_argument("TestFileSet needs at least one non-empty file");

    std::string tmpl = (workDir / "pathwatch_nettest_XXXXXX").string();
    if (!::mkdtemp(tmpl.data()))
        throw std::runtime_error("Failed to create test directory under " + workDir.string() + ": " + std::strerror(errno));
    dir_ = tmpl;

    try {
        for (unsigned int i = 0; i < count; ++i) {
            auto path = dir_ / ("pathwatch_nettest_" + std::to_string(i) + ".iotest");
            writeRandomFile(path, sizeMb * MiB);
            files_.push_back(std::move(path));
            totalBytes_ += sizeMb * MiB;
        }
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
        throw;
    }

    log::Registry::bench()->debug("[TestFileSet] Generated {} file(s), {} bytes in {}", count, totalBytes_, dir_.string());
}

TestFileSet::~TestFileSet() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
    if (ec) log::Registry::bench()->warn("[TestFileSet] Failed to remove {}: {}", dir_.string(), ec.message());
}

std::vector<std::string> TestFileSet::fileArgs() const {
    std::vector<std::string> out;
    out.reserve(files_.size());
    for (const auto& f : files_) out.push_back(f.string());
    return out;
}

void TestFileSet::writeRandomFile(const std::filesystem::path& path, const uint64_t bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("Failed to open test file " + path.string());

    std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(ALPHABET) - 2);

    std::string chunk(MiB, '\0');
    for (uint64_t written = 0; written < bytes; written += chunk.size()) {
        for (auto& c : chunk) c = ALPHABET[pick(rng)];
        const auto n = std::min<uint64_t>(chunk.size(), bytes - written);
        out.write(chunk.data(), static_cast<std::streamsize>(n));
    }

    if (!out) throw std::runtime_error("Failed to write test file " + path.string());
}
