#pragma once

#include "config/Config.hpp"
#include "types/NetworkPerf.hpp"
#include "probe/LatencyProber.hpp"
#include "bench/PhasedBenchmark.hpp"
#include "bench/QuickThroughput.hpp"

#include <memory>
#include <vector>

namespace pw::util::exec { class Runner; }

namespace pw::collectors {

class NetworkPathCollector {
public:
    NetworkPathCollector(std::shared_ptr<util::exec::Runner> runner, config::NetworkPerfConfig cfg);

    // One record per configured path with a destination, in configuration order.
    // A path that throws yields an error record instead of aborting the cycle.
    [[nodiscard]] std::vector<types::NetworkPerfRecord> collect() const;

    // Throws whatever the measurement throws.
    [[nodiscard]] types::NetworkPerfRecord collectPath(const config::PathConfig& path) const;

    [[nodiscard]] const config::NetworkPerfConfig& config() const { return cfg_; }

private:
    std::shared_ptr<util::exec::Runner> runner_;
    config::NetworkPerfConfig cfg_;
    probe::LatencyProber prober_;
    bench::PhasedBenchmark benchmark_;
    bench::QuickThroughput quick_;

    [[nodiscard]] types::NetworkPerfRecord collectOrError(const config::PathConfig& path) const;
    [[nodiscard]] util::exec::Remote remoteFor(const config::PathConfig& path) const;
};

}
