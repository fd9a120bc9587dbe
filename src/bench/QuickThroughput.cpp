#include "bench/QuickThroughput.hpp"
#include "bench/PhasedBenchmark.hpp"
#include "probe/RetransmitCounter.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace pw::bench;
using namespace pw::types;
using namespace pw::util::exec;

QuickThroughput::QuickThroughput(std::shared_ptr<Runner> runner, config::NetworkPerfConfig cfg)
    : runner_(std::move(runner)), cfg_(std::move(cfg)) {}

std::optional<ThroughputStats> QuickThroughput::measure(const Remote& dest) const {
    if (auto stats = iperf(dest)) return stats;
    return sshStream(dest);
}

std::optional<ThroughputStats> QuickThroughput::parseIperfJson(const std::string& json, const unsigned int duration) {
    const auto data = nlohmann::json::parse(json);
    if (!data.contains("end") || !data["end"].contains("sum_sent")) return std::nullopt;

    const auto& sent = data["end"]["sum_sent"];
    ThroughputStats stats;
    stats.bytes_transferred = sent.value("bytes", uint64_t{0});
    stats.rate_mbps = sent.value("bits_per_second", 0.0) / 1e6;
    stats.duration_sec = sent.value("seconds", static_cast<double>(duration));
    return stats;
}

std::optional<ThroughputStats> QuickThroughput::iperf(const Remote& dest) const {
    if (!runner_->toolAvailable("iperf3")) {
        log::Registry::bench()->debug("[QuickThroughput] iperf3 not installed");
        return std::nullopt;
    }

    const probe::RetransmitCounter retrans(runner_);
    try {
        const auto before = retrans.read();
        const auto output = runner_->run({"iperf3", "-c", dest.host, "-t", std::to_string(cfg_.iperf_duration), "-J"},
                                         std::chrono::seconds(cfg_.iperf_duration + 30));
        const auto after = retrans.read();

        auto stats = parseIperfJson(output, cfg_.iperf_duration);
        if (!stats) {
            log::Registry::bench()->debug("[QuickThroughput] iperf3 output to {} has no end.sum_sent", dest.host);
            return std::nullopt;
        }
        stats->tcp_retrans = probe::RetransmitCounter::delta(before, after);
        return stats;
    } catch (const CollectionError& e) {
        log::Registry::bench()->debug("[QuickThroughput] iperf3 to {} failed: {}", dest.host, e.what());
    } catch (const nlohmann::json::exception& e) {
        log::Registry::bench()->debug("[QuickThroughput] Unparseable iperf3 output from {}: {}", dest.host, e.what());
    }
    return std::nullopt;
}

std::optional<ThroughputStats> QuickThroughput::sshStream(const Remote& dest) const {
    if (!runner_->toolAvailable("pv")) {
        log::Registry::bench()->debug("[QuickThroughput] pv not installed, no ssh fallback");
        return std::nullopt;
    }

    const probe::RetransmitCounter retrans(runner_);
    try {
        const auto before = retrans.read();
        const auto result = runner_->runPipeline({
            {"dd", "if=/dev/zero", "bs=1M", "count=" + std::to_string(cfg_.ssh_fallback_size_mb)},
            {"pv", "-f", "-n", "-b"},
            sshArgv(dest, DISCARD_SINK)
        }, cfg_.transfer_timeout);
        const auto after = retrans.read();

        ThroughputStats stats;
        const auto pvBytes = result.stages.size() > 1 ? PhasedBenchmark::parsePvBytes(result.stages[1].stderr_text) : std::nullopt;
        stats.bytes_transferred = pvBytes.value_or(static_cast<uint64_t>(cfg_.ssh_fallback_size_mb) * 1024 * 1024);
        stats.duration_sec = SSH_FALLBACK_ASSUMED_SECONDS;
        stats.rate_mbps = rateMbps(stats.bytes_transferred, SSH_FALLBACK_ASSUMED_SECONDS);
        stats.tcp_retrans = probe::RetransmitCounter::delta(before, after);
        stats.estimated = true;
        return stats;
    } catch (const CollectionError& e) {
        log::Registry::bench()->warn("[QuickThroughput] ssh stream to {} failed: {}", dest.host, e.what());
        return std::nullopt;
    }
}
