#include "db/Schema.hpp"
#include "db/Transactions.hpp"

void pw::db::ensureSchema() {
    Transactions::exec("Schema::ensureSchema", [](pqxx::work& txn) {
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS network_perf (
                id                   SERIAL PRIMARY KEY,
                timestamp            TIMESTAMPTZ NOT NULL,
                source_host          TEXT NOT NULL,
                dest_host            TEXT NOT NULL,
                path_type            TEXT,
                status               TEXT,
                ping_min_ms          DOUBLE PRECISION,
                ping_avg_ms          DOUBLE PRECISION,
                ping_max_ms          DOUBLE PRECISION,
                ping_mdev_ms         DOUBLE PRECISION,
                ping_loss_pct        DOUBLE PRECISION CHECK (ping_loss_pct IS NULL OR ping_loss_pct BETWEEN 0 AND 100),
                throughput_mbps      DOUBLE PRECISION CHECK (throughput_mbps IS NULL OR throughput_mbps >= 0),
                bytes_transferred    BIGINT CHECK (bytes_transferred IS NULL OR bytes_transferred >= 0),
                tcp_retrans          BIGINT CHECK (tcp_retrans IS NULL OR tcp_retrans >= 0),
                cold_mbps            DOUBLE PRECISION,
                write_mbps           DOUBLE PRECISION,
                throughput_estimated BOOLEAN NOT NULL DEFAULT FALSE
            )
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_netperf_timestamp ON network_perf (timestamp)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_netperf_path ON network_perf (source_host, dest_host)");
    });

    log::Registry::db()->debug("[Schema] network_perf schema ensured");
}
