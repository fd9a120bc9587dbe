#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace pw::concurrency {

class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    // Waits for the current iteration of runLoop() to finish.
    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;

    virtual void runLoop() = 0;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Returns early when stop() is called.
    template<typename Rep, typename Period>
    void lazySleep(const std::chrono::duration<Rep, Period>& d) {
        std::unique_lock lock(sleepMutex_);
        sleepCv_.wait_for(lock, d, [this] { return shouldStop(); });
    }

private:
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
