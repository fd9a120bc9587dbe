#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace pw::util::exec { class Runner; }

namespace pw::probe {

// Kernel-wide TcpRetransSegs. Readings are differenced by callers.
class RetransmitCounter {
public:
    explicit RetransmitCounter(std::shared_ptr<util::exec::Runner> runner,
                               std::filesystem::path snmpPath = "/proc/net/snmp");

    // 0 when neither nstat nor the snmp table can be read
    [[nodiscard]] uint64_t read() const;

    static std::optional<uint64_t> parseNstat(const std::string& output);
    static std::optional<uint64_t> parseSnmp(const std::string& content);

    static uint64_t delta(const uint64_t before, const uint64_t after) { return after > before ? after - before : 0; }

private:
    std::shared_ptr<util::exec::Runner> runner_;
    std::filesystem::path snmpPath_;
};

}
