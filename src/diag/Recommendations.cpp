#include "diag/Recommendations.hpp"

#include <algorithm>
#include <map>

using namespace pw::types;

namespace {

const std::vector<std::string> PACKET_LOSS{
    "Check cable connections and switch ports",
    "Verify switch port error counters: show interface counters errors",
    "Test with different cables or ports"
};

const std::vector<std::string> LATENCY{
    "Check for routing changes: traceroute <dest>",
    "Verify no bandwidth-heavy processes running",
    "Check switch/router CPU utilization"
};

const std::vector<std::string> JITTER{
    "Network jitter often indicates congestion",
    "Check for broadcast storms or network loops",
    "Consider QoS policies for critical traffic"
};

const std::vector<std::string> RETRANSMITS{
    "TCP retransmits indicate packet loss",
    "Check for duplex mismatch: ethtool <interface>",
    "Verify MTU settings match across path"
};

const std::vector<std::string> CONGESTION{
    "Consider dedicated network path for HPC traffic",
    "Evaluate traffic shaping or QoS policies",
    "Schedule large transfers for off-hours",
    "Document congestion pattern for infrastructure upgrade proposal"
};

const std::vector<std::string> LOW_THROUGHPUT{
    "Run iperf3 test to isolate bottleneck: iperf3 -c <dest>",
    "Check NIC link speed: ethtool <interface>",
    "Verify no half-duplex links in path"
};

const std::vector<std::string> COLLECTION_FAILED{
    "Verify the destination is up and reachable: ping <dest>",
    "Check non-interactive ssh access: ssh -o BatchMode=yes <dest> true",
    "Review the pathwatch collector log for the failing command"
};

const std::vector<std::string> NONE{};

const std::map<CauseKind, const std::vector<std::string>*> TABLE{
    {CauseKind::CollectionFailed, &COLLECTION_FAILED},
    {CauseKind::HighPacketLoss, &PACKET_LOSS},
    {CauseKind::ElevatedPacketLoss, &PACKET_LOSS},
    {CauseKind::HighLatency, &LATENCY},
    {CauseKind::ElevatedLatency, &LATENCY},
    {CauseKind::IncreasingLatency, &LATENCY},
    {CauseKind::HighJitter, &JITTER},
    {CauseKind::ExcessiveRetransmits, &RETRANSMITS},
    {CauseKind::ElevatedRetransmits, &RETRANSMITS},
    {CauseKind::BusinessHoursCongestion, &CONGESTION},
    {CauseKind::MildBusinessHoursImpact, &CONGESTION},
    {CauseKind::LowThroughput, &LOW_THROUGHPUT},
    {CauseKind::DecliningThroughput, &LOW_THROUGHPUT},
};

}

const std::vector<std::string>& pw::diag::recommendationsFor(const CauseKind kind) {
    const auto it = TABLE.find(kind);
    return it == TABLE.end() ? NONE : *it->second;
}

std::vector<std::string> pw::diag::recommend(const std::vector<Cause>& causes) {
    std::vector<std::string> out;
    for (const auto& cause : causes)
        for (const auto& rec : recommendationsFor(cause.kind))
            if (std::find(out.begin(), out.end(), rec) == out.end()) out.push_back(rec);

    if (out.empty()) out.emplace_back(NO_ACTION_RECOMMENDATION);
    return out;
}
