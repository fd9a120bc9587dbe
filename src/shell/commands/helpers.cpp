#include "helpers.hpp"
#include "config/Config.hpp"
#include "db/Schema.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <mutex>

namespace pw::shell {

void ensureDatabase(const config::DatabaseConfig& cfg) {
    static std::mutex mtx;
    std::scoped_lock lock(mtx);
    if (db::Transactions::isInitialized()) return;

    log::Registry::shell()->debug("[ensureDatabase] Connecting to {}:{}/{}", cfg.host, cfg.port, cfg.name);
    db::Transactions::init(cfg);
    db::ensureSchema();
    db::Transactions::initPrepared();
}

std::string fmtOpt(const std::optional<double>& v, const int precision, const char* unit) {
    if (!v) return "-";
    return fmt::format("{:.{}f}{}", *v, precision, unit);
}

static std::string throughputPart(const char* label, const std::optional<types::ThroughputStats>& t) {
    if (!t) return {};
    return fmt::format(" {}={:.2f}Mbps{}", label, t->rate_mbps, t->estimated ? "~" : "");
}

std::string summaryLine(const types::NetworkPerfRecord& record) {
    std::string line = fmt::format("{} -> {} [{}] {}",
                                   record.source_host, record.dest_host,
                                   types::to_string(record.path_type), types::to_string(record.status));
    if (record.ping)
        line += fmt::format(" loss={:.1f}% avg={:.2f}ms jitter={:.2f}ms",
                            record.ping->loss_pct, record.ping->avg_ms, record.ping->mdev_ms);
    line += throughputPart("cold", record.cold);
    line += throughputPart("hot", record.hot);
    line += throughputPart("write", record.write);
    if (const auto& t = record.representativeThroughput(); t && t->tcp_retrans)
        line += fmt::format(" retrans={}", t->tcp_retrans);
    return line;
}

}
