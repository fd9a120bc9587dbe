#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace pw::concurrency;

AsyncService::AsyncService(std::string serviceName)
    : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;

    if (worker_.joinable()) worker_.join();  // loop exited on its own earlier

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::pathwatch()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::pathwatch()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        log::Registry::pathwatch()->info("[{}] Stopping service...", serviceName_);
        worker_.join();
        log::Registry::pathwatch()->info("[{}] Service stopped.", serviceName_);
    }

    running_.store(false, std::memory_order_release);
}
