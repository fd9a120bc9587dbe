#include "db/DBConnection.hpp"
#include "db/query/NetworkPerf.hpp"

using pw::db::query::NetworkPerf;

void pw::db::DBConnection::initPreparedNetworkPerf() const {
    const std::string select = std::string("SELECT ") + NetworkPerf::SELECT_COLUMNS + " FROM network_perf ";
    const std::string pathFilter = "WHERE ($1::text IS NULL OR source_host = $1) "
                                   "AND ($2::text IS NULL OR dest_host = $2) ";

    conn_->prepare("network_perf.insert",
                   "INSERT INTO network_perf (timestamp, source_host, dest_host, path_type, status, "
                   "ping_min_ms, ping_avg_ms, ping_max_ms, ping_mdev_ms, ping_loss_pct, "
                   "throughput_mbps, bytes_transferred, tcp_retrans, cold_mbps, write_mbps, throughput_estimated) "
                   "VALUES (to_timestamp($1), $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16) "
                   "RETURNING id");

    conn_->prepare("network_perf.latest",
                   select + pathFilter + "ORDER BY timestamp DESC, id DESC LIMIT 1");

    conn_->prepare("network_perf.history",
                   select + pathFilter +
                   "AND timestamp >= NOW() - make_interval(hours => $3) "
                   "ORDER BY timestamp ASC, id ASC");

    conn_->prepare("network_perf.list_paths",
                   "SELECT source_host, dest_host, "
                   "(array_agg(path_type ORDER BY timestamp DESC))[1] AS path_type, "
                   "COUNT(*) AS samples, "
                   "to_char(MAX(timestamp) AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS') AS last_seen "
                   "FROM network_perf GROUP BY source_host, dest_host ORDER BY source_host, dest_host");

    conn_->prepare("network_perf.purge_older_than",
                   "DELETE FROM network_perf WHERE timestamp < NOW() - make_interval(days => $1)");
}
