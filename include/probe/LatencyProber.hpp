#pragma once

#include "types/NetworkPerf.hpp"

#include <memory>
#include <string>

namespace pw::util::exec { class Runner; }

namespace pw::probe {

class LatencyProber {
public:
    LatencyProber(std::shared_ptr<util::exec::Runner> runner, unsigned int count = 10);

    // Never throws for an unreachable host: a failed probe is PingStats::failed().
    [[nodiscard]] types::PingStats measure(const std::string& dest) const;

    // Fields absent from the output stay zero.
    static types::PingStats parse(const std::string& output);

private:
    std::shared_ptr<util::exec::Runner> runner_;
    unsigned int count_;
};

}
