#include "db/DBConnection.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <stdexcept>

namespace pw::db {

namespace {

std::string quoteValue(const std::string& v) {
    std::string out = "'";
    for (const char c : v) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += "'";
    return out;
}

std::string readPassword(const std::filesystem::path& f) {
    std::ifstream in(f);
    if (!in.is_open()) throw std::runtime_error("Failed to open database password file: " + f.string());

    std::string pass;
    std::getline(in, pass);
    while (!pass.empty() && (pass.back() == '\r' || pass.back() == ' ')) pass.pop_back();
    if (pass.empty()) throw std::runtime_error("Database password file is empty: " + f.string());
    return pass;
}

}

std::string connectionString(const config::DatabaseConfig& cfg) {
    std::string s = "host=" + quoteValue(cfg.host)
                  + " port=" + std::to_string(cfg.port)
                  + " dbname=" + quoteValue(cfg.name)
                  + " user=" + quoteValue(cfg.user)
                  + " application_name=pathwatch";
    if (!cfg.password_file.empty()) s += " password=" + quoteValue(readPassword(cfg.password_file));
    return s;
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : conn_(std::make_unique<pqxx::connection>(connectionString(cfg))) {
    log::Registry::db()->debug("[DBConnection] Connected to {}@{}:{}/{}", cfg.user, cfg.host, cfg.port, cfg.name);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedNetworkPerf();
}

} // namespace pw::db
