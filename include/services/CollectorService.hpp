#pragma once

#include "collectors/NetworkPathCollector.hpp"
#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace pw::services {

using RecordSink = std::function<void(const std::vector<types::NetworkPerfRecord>&)>;

// Runs a collection cycle every interval and hands the records to the sink.
class CollectorService final : public concurrency::AsyncService {
public:
    CollectorService(std::shared_ptr<collectors::NetworkPathCollector> collector,
                     std::chrono::minutes interval,
                     RecordSink sink);
    ~CollectorService() override;

    // One cycle on the calling thread. Sink failures are logged, not thrown.
    std::vector<types::NetworkPerfRecord> runCycle() const;

protected:
    void runLoop() override;

private:
    std::shared_ptr<collectors::NetworkPathCollector> collector_;
    std::chrono::minutes interval_;
    RecordSink sink_;
};

}
