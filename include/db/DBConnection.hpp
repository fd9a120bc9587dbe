#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace pw::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedNetworkPerf() const;
};

// libpq keyword/value string; the password is read from password_file when set.
std::string connectionString(const config::DatabaseConfig& cfg);

} // namespace pw::db
