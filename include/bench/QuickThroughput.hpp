#pragma once

#include "config/Config.hpp"
#include "types/NetworkPerf.hpp"
#include "util/exec.hpp"

#include <memory>
#include <optional>
#include <string>

namespace pw::bench {

inline constexpr double SSH_FALLBACK_ASSUMED_SECONDS = 10.0;

// Single-shot throughput: iperf3 when installed, else an ssh stream of zero blocks.
class QuickThroughput {
public:
    QuickThroughput(std::shared_ptr<util::exec::Runner> runner, config::NetworkPerfConfig cfg);

    [[nodiscard]] std::optional<types::ThroughputStats> measure(const util::exec::Remote& dest) const;

    [[nodiscard]] std::optional<types::ThroughputStats> iperf(const util::exec::Remote& dest) const;

    // Rate is computed from an assumed duration and flagged estimated.
    [[nodiscard]] std::optional<types::ThroughputStats> sshStream(const util::exec::Remote& dest) const;

    // end.sum_sent of `iperf3 -J`. Throws nlohmann::json::exception on malformed input.
    static std::optional<types::ThroughputStats> parseIperfJson(const std::string& json, unsigned int duration);

private:
    std::shared_ptr<util::exec::Runner> runner_;
    config::NetworkPerfConfig cfg_;
};

}
