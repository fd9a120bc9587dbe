#include "db/Janitor.hpp"
#include "db/query/NetworkPerf.hpp"
#include "log/Registry.hpp"

pw::db::Janitor::Janitor(const unsigned int retentionDays, const std::chrono::minutes sweepInterval)
    : AsyncService("Janitor"),
      retention_days_(retentionDays),
      sweep_interval_(sweepInterval) {}

pw::db::Janitor::~Janitor() { stop(); }

void pw::db::Janitor::runLoop() {
    if (retention_days_ == 0) {
        log::Registry::db()->info("[Janitor] Retention disabled, nothing to purge");
        return;
    }

    while (!shouldStop()) {
        try {
            if (const auto purged = query::NetworkPerf::purgeOlderThan(retention_days_))
                log::Registry::db()->info("[Janitor] Purged {} network_perf row(s) older than {} days", purged, retention_days_);
        } catch (const std::exception& e) {
            log::Registry::db()->warn("[Janitor] Failed to purge old network_perf rows: {}", e.what());
        }

        lazySleep(sweep_interval_);
    }
}
