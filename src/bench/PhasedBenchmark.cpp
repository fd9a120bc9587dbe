#include "bench/PhasedBenchmark.hpp"
#include "bench/CacheControl.hpp"
#include "bench/TestFileSet.hpp"
#include "probe/RetransmitCounter.hpp"
#include "log/Registry.hpp"

#include <sstream>
#include <thread>

using namespace pw::bench;
using namespace pw::types;
using namespace pw::util::exec;

PhasedBenchmark::PhasedBenchmark(std::shared_ptr<Runner> runner, config::NetworkPerfConfig cfg)
    : runner_(std::move(runner)), cfg_(std::move(cfg)) {}

std::optional<ThroughputStats> PhasedBenchmark::averageRuns(const std::vector<ThroughputStats>& runs) {
    if (runs.empty()) return std::nullopt;

    uint64_t bytes = 0;
    double rate = 0.0, duration = 0.0;
    for (const auto& r : runs) {
        bytes += r.bytes_transferred;
        rate += r.rate_mbps;
        duration += r.duration_sec;
    }

    const auto n = runs.size();
    ThroughputStats avg;
    avg.bytes_transferred = bytes / n;
    avg.rate_mbps = rate / static_cast<double>(n);
    avg.duration_sec = duration / static_cast<double>(n);
    return avg;
}

std::optional<uint64_t> PhasedBenchmark::parsePvBytes(const std::string& pvStderr) {
    std::istringstream ss(pvStderr);
    std::optional<uint64_t> last;
    for (std::string line; std::getline(ss, line);) {
        const auto t = trim(line);
        if (t.empty() || t.find_first_not_of("0123456789") != std::string::npos) continue;
        try {
            last = std::stoull(t);
        } catch (const std::out_of_range&) {
            continue;
        }
    }
    return last;
}

std::vector<Argv> PhasedBenchmark::transferPipeline(const std::vector<std::string>& files,
                                                    const Remote& dest,
                                                    const std::string& sink) {
    Argv cat{"cat"};
    cat.insert(cat.end(), files.begin(), files.end());
    return {
        cat,
        {"pv", "-f", "-n", "-b"},
        sshArgv(dest, sink, {"Compression=no"})
    };
}

ThroughputStats PhasedBenchmark::transfer_(const std::vector<std::string>& files, const uint64_t knownBytes,
                                           const Remote& dest, const std::string& sink) const {
    const auto result = runner_->runPipeline(transferPipeline(files, dest, sink), cfg_.transfer_timeout);
    if (result.elapsed_sec <= 0.0)
        throw CollectionError(excerpt("cat | pv | ssh " + dest.target()),
                              "transfer reported no elapsed time");

    ThroughputStats stats;
    const auto pvBytes = result.stages.size() > 1 ? parsePvBytes(result.stages[1].stderr_text) : std::nullopt;
    stats.bytes_transferred = pvBytes.value_or(knownBytes);
    stats.duration_sec = result.elapsed_sec;
    stats.rate_mbps = rateMbps(stats.bytes_transferred, stats.duration_sec);
    return stats;
}

BenchmarkResult PhasedBenchmark::run(const Remote& dest) const {
    BenchmarkResult result;
    const auto logger = log::Registry::bench();

    if (!runner_->toolAvailable("pv")) {
        logger->warn("[PhasedBenchmark] pv not installed, skipping phased benchmark to {}", dest.host);
        result.error = "pv not installed";
        return result;
    }

    std::unique_ptr<TestFileSet> fileSet;
    try {
        fileSet = std::make_unique<TestFileSet>(cfg_.work_dir, cfg_.num_files, cfg_.file_size_mb);
    } catch (const std::exception& e) {
        logger->error("[PhasedBenchmark] Could not generate test files: {}", e.what());
        result.error = std::string("test file generation failed: ") + e.what();
        return result;
    }

    const auto files = fileSet->fileArgs();
    const auto bytes = fileSet->totalBytes();
    const CacheControl cache(runner_);
    const probe::RetransmitCounter retrans(runner_);

    const auto retransBefore = retrans.read();

    // Phase 1
    cache.flush();
    cache.flush(dest);
    try {
        result.cold = transfer_(files, bytes, dest, DISCARD_SINK);
        logger->info("[PhasedBenchmark] Cold cache to {}: {:.1f} Mbps", dest.host, result.cold->rate_mbps);
    } catch (const CollectionError& e) {
        logger->warn("[PhasedBenchmark] Cold cache run to {} failed: {}", dest.host, e.what());
    }

    // Phase 2
    cache.pin(fileSet->files());
    for (unsigned int i = 0; i < cfg_.hot_runs; ++i) {
        if (i > 0 && cfg_.hot_run_pause.count() > 0) std::this_thread::sleep_for(cfg_.hot_run_pause);
        try {
            result.hot_runs.push_back(transfer_(files, bytes, dest, DISCARD_SINK));
        } catch (const CollectionError& e) {
            logger->warn("[PhasedBenchmark] Hot cache run {}/{} to {} failed: {}", i + 1, cfg_.hot_runs, dest.host, e.what());
        }
    }
    result.hot = averageRuns(result.hot_runs);
    if (result.hot)
        logger->info("[PhasedBenchmark] Hot cache to {}: {:.1f} Mbps over {} run(s)",
                     dest.host, result.hot->rate_mbps, result.hot_runs.size());

    // Phase 3
    cache.flush();
    cache.flush(dest);
    cache.pin(fileSet->files());
    try {
        result.write = transfer_(files, bytes, dest, WRITE_SINK);
        logger->info("[PhasedBenchmark] True write to {}: {:.1f} Mbps", dest.host, result.write->rate_mbps);
    } catch (const CollectionError& e) {
        logger->warn("[PhasedBenchmark] True write run to {} failed: {}", dest.host, e.what());
    }

    result.tcp_retrans_total = probe::RetransmitCounter::delta(retransBefore, retrans.read());
    if (result.hot) result.hot->tcp_retrans = result.tcp_retrans_total;

    return result;
}
