#pragma once

#include "config/Config.hpp"
#include "types/NetworkPerf.hpp"
#include "util/exec.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pw::bench {

struct BenchmarkResult {
    std::optional<types::ThroughputStats> cold;
    std::optional<types::ThroughputStats> hot;    // average of hot_runs
    std::optional<types::ThroughputStats> write;
    std::vector<types::ThroughputStats> hot_runs;
    uint64_t tcp_retrans_total{0};
    std::optional<std::string> error;             // protocol skipped
};

inline constexpr const char* DISCARD_SINK = "cat > /dev/null";
inline constexpr const char* WRITE_SINK =
    "cat > /tmp/pathwatch_nettest_recv.tmp && rm -f /tmp/pathwatch_nettest_recv.tmp";

// Cold cache, hot cache and true write transfers of a generated file set to one destination.
class PhasedBenchmark {
public:
    PhasedBenchmark(std::shared_ptr<util::exec::Runner> runner, config::NetworkPerfConfig cfg);

    [[nodiscard]] BenchmarkResult run(const util::exec::Remote& dest) const;

    // Integer-averaged bytes, mean rate and duration. Empty for no runs.
    static std::optional<types::ThroughputStats> averageRuns(const std::vector<types::ThroughputStats>& runs);

    // Last count printed by `pv -n -b`.
    static std::optional<uint64_t> parsePvBytes(const std::string& pvStderr);

    static std::vector<util::exec::Argv> transferPipeline(const std::vector<std::string>& files,
                                                          const util::exec::Remote& dest,
                                                          const std::string& sink);

private:
    std::shared_ptr<util::exec::Runner> runner_;
    config::NetworkPerfConfig cfg_;

    types::ThroughputStats transfer_(const std::vector<std::string>& files, uint64_t knownBytes,
                                     const util::exec::Remote& dest, const std::string& sink) const;
};

}
