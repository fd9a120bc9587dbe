#pragma once

#include "types/NetworkPerf.hpp"

#include <optional>
#include <string>

namespace pw::config { struct DatabaseConfig; }

namespace pw::shell {

// Pool, schema and prepared statements, once per process.
void ensureDatabase(const config::DatabaseConfig& cfg);

std::string fmtOpt(const std::optional<double>& v, int precision, const char* unit = "");

// "src -> dst [direct] healthy loss=0.0% avg=0.42ms hot=941.20Mbps"
std::string summaryLine(const types::NetworkPerfRecord& record);

}
