#include "db/query/NetworkPerf.hpp"
#include "db/Transactions.hpp"
#include "util/timestamp.hpp"

using namespace pw::db::query;
using namespace pw::types;

namespace {

std::optional<std::string> filter(const std::string& host) {
    if (host.empty()) return std::nullopt;
    return host;
}

std::vector<NetworkPerfSample> samplesFrom(const pqxx::result& res) {
    std::vector<NetworkPerfSample> out;
    out.reserve(res.size());
    for (const auto& row : res) out.emplace_back(row);
    return out;
}

}

unsigned int NetworkPerf::insert(const NetworkPerfSample& sample) {
    return pw::db::Transactions::exec("NetworkPerf::insert", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"network_perf.insert"}, sample.getParams()).one_field().as<unsigned int>();
    });
}

void NetworkPerf::insert(const std::vector<NetworkPerfRecord>& records) {
    if (records.empty()) return;

    pw::db::Transactions::exec("NetworkPerf::insertBatch", [&](pqxx::work& txn) {
        for (const auto& r : records)
            txn.exec(pqxx::prepped{"network_perf.insert"}, NetworkPerfSample(r).getParams());
    });
    pw::log::Registry::db()->info("[NetworkPerf] Stored {} network performance record(s)", records.size());
}

std::optional<NetworkPerfSample> NetworkPerf::getLatest(const std::string& source, const std::string& dest) {
    return pw::db::Transactions::exec("NetworkPerf::getLatest", [&](pqxx::work& txn) -> std::optional<NetworkPerfSample> {
        const auto res = txn.exec(pqxx::prepped{"network_perf.latest"}, pqxx::params{filter(source), filter(dest)});
        if (res.empty()) return std::nullopt;
        return NetworkPerfSample(res[0]);
    });
}

std::optional<NetworkPerfSample> NetworkPerf::getLatest() { return getLatest({}, {}); }

std::vector<NetworkPerfSample> NetworkPerf::getHistory(const std::string& source, const std::string& dest, const unsigned int hours) {
    return pw::db::Transactions::exec("NetworkPerf::getHistory", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"network_perf.history"},
                                  pqxx::params{filter(source), filter(dest), static_cast<int>(hours)});
        return samplesFrom(res);
    });
}

std::vector<NetworkPerfSample> NetworkPerf::getHistory(const unsigned int hours) { return getHistory({}, {}, hours); }

std::vector<PathSummary> NetworkPerf::listPaths() {
    return pw::db::Transactions::exec("NetworkPerf::listPaths", [&](pqxx::work& txn) {
        std::vector<PathSummary> out;
        for (const auto& row : txn.exec(pqxx::prepped{"network_perf.list_paths"})) {
            PathSummary s;
            s.source_host = row["source_host"].as<std::string>();
            s.dest_host = row["dest_host"].as<std::string>();
            s.path_type = pathTypeFromString(row["path_type"].is_null() ? "" : row["path_type"].as<std::string>());
            s.samples = row["samples"].as<uint64_t>();
            s.last_seen = pw::util::parsePostgresTimestamp(row["last_seen"].c_str());
            out.push_back(std::move(s));
        }
        return out;
    });
}

uint64_t NetworkPerf::purgeOlderThan(const unsigned int days) {
    return pw::db::Transactions::exec("NetworkPerf::purgeOlderThan", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"network_perf.purge_older_than"}, pqxx::params{static_cast<int>(days)});
        return static_cast<uint64_t>(res.affected_rows());
    });
}
