#include "probe/RetransmitCounter.hpp"
#include "util/exec.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <sstream>
#include <vector>

using namespace pw::probe;
using namespace pw::util::exec;

namespace {

std::vector<std::string> splitWs(const std::string& line) {
    std::istringstream ss(line);
    std::vector<std::string> out;
    for (std::string w; ss >> w;) out.push_back(w);
    return out;
}

std::optional<uint64_t> toCount(const std::string& s) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}

RetransmitCounter::RetransmitCounter(std::shared_ptr<Runner> runner, std::filesystem::path snmpPath)
    : runner_(std::move(runner)), snmpPath_(std::move(snmpPath)) {}

std::optional<uint64_t> RetransmitCounter::parseNstat(const std::string& output) {
    std::istringstream ss(output);
    for (std::string line; std::getline(ss, line);) {
        const auto parts = splitWs(line);
        if (parts.size() >= 2 && parts[0] == "TcpRetransSegs") return toCount(parts[1]);
    }
    return std::nullopt;
}

// Two "Tcp:" lines, a header row then a value row, matched by column.
std::optional<uint64_t> RetransmitCounter::parseSnmp(const std::string& content) {
    std::istringstream ss(content);
    std::vector<std::string> header;
    for (std::string line; std::getline(ss, line);) {
        if (line.rfind("Tcp:", 0) != 0) continue;
        auto parts = splitWs(line);
        if (header.empty()) {
            header = std::move(parts);
            continue;
        }
        for (size_t i = 1; i < header.size() && i < parts.size(); ++i)
            if (header[i] == "RetransSegs") return toCount(parts[i]);
        return std::nullopt;
    }
    return std::nullopt;
}

uint64_t RetransmitCounter::read() const {
    try {
        if (const auto v = parseNstat(runner_->run({"nstat", "-az", "TcpRetransSegs"}, std::chrono::seconds(10))))
            return *v;
    } catch (const CollectionError& e) {
        log::Registry::probe()->debug("[RetransmitCounter] nstat unavailable: {}", e.what());
    }

    std::ifstream in(snmpPath_);
    if (!in.is_open()) {
        log::Registry::probe()->debug("[RetransmitCounter] Cannot open {}", snmpPath_.string());
        return 0;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parseSnmp(buffer.str()).value_or(0);
}
