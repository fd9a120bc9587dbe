#include "bench/CacheControl.hpp"
#include "log/Registry.hpp"

using namespace pw::bench;
using namespace pw::util::exec;

namespace {

const Argv FLUSH_ARGV{"sh", "-c", "sync; echo 3 | sudo -n tee /proc/sys/vm/drop_caches > /dev/null"};

}

CacheControl::CacheControl(std::shared_ptr<Runner> runner, const std::chrono::seconds timeout)
    : runner_(std::move(runner)), timeout_(timeout) {}

bool CacheControl::flush(const std::optional<Remote>& remote) const {
    const auto where = remote && !remote->isLocal() ? remote->host : std::string("local host");
    try {
        runner_->run(FLUSH_ARGV, timeout_, remote);
        log::Registry::bench()->debug("[CacheControl] Dropped page cache on {}", where);
        return true;
    } catch (const CollectionError& e) {
        log::Registry::bench()->info("[CacheControl] Could not drop page cache on {}: {}", where, e.what());
        return false;
    }
}

bool CacheControl::pin(const std::vector<std::filesystem::path>& files) const {
    if (files.empty()) return true;

    std::vector<std::string> paths;
    for (const auto& f : files) paths.push_back(f.string());

    try {
        if (runner_->toolAvailable("vmtouch")) {
            Argv argv{"vmtouch", "-t"};
            argv.insert(argv.end(), paths.begin(), paths.end());
            runner_->run(argv, timeout_ * 2);
        } else {
            Argv argv{"sh", "-c", "cat \"$@\" > /dev/null", "sh"};
            argv.insert(argv.end(), paths.begin(), paths.end());
            runner_->run(argv, timeout_ * 2);
        }
        return true;
    } catch (const CollectionError& e) {
        log::Registry::bench()->warn("[CacheControl] Failed to pin {} file(s) in cache: {}", files.size(), e.what());
        return false;
    }
}
