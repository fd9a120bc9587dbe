#include <gtest/gtest.h>
#include "db/DBConnection.hpp"

#include <filesystem>
#include <fstream>

using namespace pw::db;

TEST(ConnectionStringTest, QuotesEveryValue) {
    pw::config::DatabaseConfig cfg;
    cfg.host = "db.lab";
    cfg.port = 6543;
    cfg.name = "perf";
    cfg.user = "o'brien";

    EXPECT_EQ(connectionString(cfg),
              "host='db.lab' port=6543 dbname='perf' user='o\\'brien' application_name=pathwatch");
}

TEST(ConnectionStringTest, ReadsPasswordFile) {
    const auto path = std::filesystem::temp_directory_path() / "pathwatch_test_dbpass";
    {
        std::ofstream out(path);
        out << "s3cret \n";
    }

    pw::config::DatabaseConfig cfg;
    cfg.password_file = path.string();
    EXPECT_NE(connectionString(cfg).find(" password='s3cret'"), std::string::npos);
    std::filesystem::remove(path);

    EXPECT_THROW((void)connectionString(cfg), std::runtime_error);
}
