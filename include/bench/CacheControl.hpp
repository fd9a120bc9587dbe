#pragma once

#include "util/exec.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace pw::bench {

// Page-cache state control. Every operation is best effort and reports success.
class CacheControl {
public:
    explicit CacheControl(std::shared_ptr<util::exec::Runner> runner,
                          std::chrono::seconds timeout = std::chrono::seconds(30));

    // Local when remote is empty or names this host. sudo never prompts.
    bool flush(const std::optional<util::exec::Remote>& remote = std::nullopt) const;

    // vmtouch -t when installed, else a sequential read to /dev/null.
    bool pin(const std::vector<std::filesystem::path>& files) const;

private:
    std::shared_ptr<util::exec::Runner> runner_;
    std::chrono::seconds timeout_;
};

}
