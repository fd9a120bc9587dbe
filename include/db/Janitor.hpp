#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>

namespace pw::db {

// Purges network_perf rows older than the retention window.
class Janitor final : public concurrency::AsyncService {
public:
    Janitor(unsigned int retentionDays, std::chrono::minutes sweepInterval);
    ~Janitor() override;

protected:
    void runLoop() override;

private:
    unsigned int retention_days_;
    std::chrono::minutes sweep_interval_;
};

}
