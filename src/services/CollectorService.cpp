#include "services/CollectorService.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace pw::services;
using namespace pw::types;

CollectorService::CollectorService(std::shared_ptr<collectors::NetworkPathCollector> collector,
                                   const std::chrono::minutes interval,
                                   RecordSink sink)
    : AsyncService("CollectorService"),
      collector_(std::move(collector)),
      interval_(interval),
      sink_(std::move(sink)) {}

CollectorService::~CollectorService() { stop(); }

std::vector<NetworkPerfRecord> CollectorService::runCycle() const {
    const auto started = std::chrono::steady_clock::now();
    auto records = collector_->collect();

    const auto healthy = std::count_if(records.begin(), records.end(),
                                       [](const NetworkPerfRecord& r) { return r.status == PathStatus::Healthy; });
    log::Registry::collector()->info("[CollectorService] Collected {} path(s), {} healthy, in {:.1f}s",
                                     records.size(), healthy,
                                     std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    if (sink_ && !records.empty()) {
        try {
            sink_(records);
        } catch (const std::exception& e) {
            log::Registry::collector()->error("[CollectorService] Failed to store {} record(s): {}", records.size(), e.what());
        }
    }

    return records;
}

void CollectorService::runLoop() {
    while (!shouldStop()) {
        runCycle();
        lazySleep(interval_);
    }
}
