#include "probe/LatencyProber.hpp"
#include "util/exec.hpp"
#include "log/Registry.hpp"

#include <regex>

using namespace pw::probe;
using namespace pw::types;
using namespace pw::util::exec;

LatencyProber::LatencyProber(std::shared_ptr<Runner> runner, const unsigned int count)
    : runner_(std::move(runner)), count_(count == 0 ? 1 : count) {}

PingStats LatencyProber::parse(const std::string& output) {
    static const std::regex lossRe(R"((\d+(?:\.\d+)?)% packet loss)");
    static const std::regex rttRe(R"(rtt min/avg/max/mdev = ([\d.]+)/([\d.]+)/([\d.]+)/([\d.]+))");

    PingStats stats;
    std::smatch m;

    if (std::regex_search(output, m, lossRe)) stats.loss_pct = std::stod(m[1].str());

    if (std::regex_search(output, m, rttRe)) {
        stats.min_ms = std::stod(m[1].str());
        stats.avg_ms = std::stod(m[2].str());
        stats.max_ms = std::stod(m[3].str());
        stats.mdev_ms = std::stod(m[4].str());
    }

    return stats;
}

PingStats LatencyProber::measure(const std::string& dest) const {
    try {
        const auto output = runner_->run({"ping", "-c", std::to_string(count_), "-q", dest},
                                         std::chrono::seconds(count_ + 10));
        auto stats = parse(output);
        log::Registry::probe()->debug("[LatencyProber] {}: avg {:.3f} ms, loss {:.1f}%", dest, stats.avg_ms, stats.loss_pct);
        return stats;
    } catch (const CollectionError& e) {
        log::Registry::probe()->warn("[LatencyProber] Ping to {} failed: {}", dest, e.what());
        return PingStats::failed();
    }
}
