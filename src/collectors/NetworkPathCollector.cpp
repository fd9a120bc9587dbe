#include "collectors/NetworkPathCollector.hpp"
#include "concurrency/ThreadPool.hpp"
#include "util/exec.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <functional>
#include <future>

using namespace pw::collectors;
using namespace pw::types;
using namespace pw::util::exec;

namespace {

struct PathCollectTask final : pw::concurrency::PromisedTask<NetworkPerfRecord> {
    std::function<NetworkPerfRecord()> fn;

    explicit PathCollectTask(std::function<NetworkPerfRecord()> f) : fn(std::move(f)) {}

    void operator()() override {
        try {
            promise.set_value(fn());
        } catch (const std::exception&) {
            promise.set_exception(std::current_exception());
        }
    }
};

}

NetworkPathCollector::NetworkPathCollector(std::shared_ptr<Runner> runner, config::NetworkPerfConfig cfg)
    : runner_(std::move(runner)),
      cfg_(std::move(cfg)),
      prober_(runner_, cfg_.ping_count),
      benchmark_(runner_, cfg_),
      quick_(runner_, cfg_) {}

Remote NetworkPathCollector::remoteFor(const config::PathConfig& path) const {
    return {path.dest, path.user, path.identity_file, cfg_.ssh_connect_timeout};
}

NetworkPerfRecord NetworkPathCollector::collectPath(const config::PathConfig& path) const {
    NetworkPerfRecord record;
    record.source_host = path.source.empty() ? localHostname() : path.source;
    record.dest_host = path.dest;
    record.path_type = path.path_type;
    record.timestamp = util::now();

    record.ping = prober_.measure(path.dest);

    const auto dest = remoteFor(path);
    if (cfg_.full_test) {
        auto result = benchmark_.run(dest);
        if (result.error) {
            log::Registry::collector()->warn("[NetworkPathCollector] {} -> {}: {}, falling back to quick test",
                                             record.source_host, record.dest_host, *result.error);
            record.hot = quick_.measure(dest);
        } else {
            record.cold = std::move(result.cold);
            record.hot = std::move(result.hot);
            record.write = std::move(result.write);
        }
    } else {
        record.hot = quick_.measure(dest);
    }

    record.status = deriveStatus(record, cfg_.health);
    return record;
}

NetworkPerfRecord NetworkPathCollector::collectOrError(const config::PathConfig& path) const {
    try {
        auto record = collectPath(path);
        log::Registry::collector()->debug("[NetworkPathCollector] Collected {} -> {}: {}",
                                          record.source_host, record.dest_host, to_string(record.status));
        return record;
    } catch (const std::exception& e) {
        const auto source = path.source.empty() ? localHostname() : path.source;
        log::Registry::collector()->error("[NetworkPathCollector] Failed to collect {} -> {}: {}", source, path.dest, e.what());
        return NetworkPerfRecord::errorRecord(source, path.dest, path.path_type, util::now());
    }
}

std::vector<NetworkPerfRecord> NetworkPathCollector::collect() const {
    std::vector<config::PathConfig> paths;
    for (const auto& p : cfg_.paths) {
        if (p.dest.empty()) {
            log::Registry::collector()->debug("[NetworkPathCollector] Skipping path entry without destination");
            continue;
        }
        paths.push_back(p);
    }

    std::vector<NetworkPerfRecord> records;
    records.reserve(paths.size());

    if (cfg_.max_parallel_paths <= 1 || paths.size() <= 1) {
        for (const auto& p : paths) records.push_back(collectOrError(p));
        return records;
    }

    concurrency::ThreadPool pool(std::min<unsigned int>(cfg_.max_parallel_paths, static_cast<unsigned int>(paths.size())));
    std::vector<std::future<NetworkPerfRecord>> futures;
    futures.reserve(paths.size());

    for (const auto& p : paths) {
        auto task = std::make_shared<PathCollectTask>([this, p] { return collectOrError(p); });
        futures.push_back(task->getFuture());
        pool.submit(task);
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            records.push_back(futures[i].get());
        } catch (const std::exception& e) {
            log::Registry::collector()->error("[NetworkPathCollector] Worker for {} failed: {}", paths[i].dest, e.what());
            records.push_back(NetworkPerfRecord::errorRecord(
                paths[i].source.empty() ? localHostname() : paths[i].source, paths[i].dest, paths[i].path_type, util::now()));
        }
    }

    pool.stop();
    return records;
}
