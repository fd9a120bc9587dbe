#pragma once

#include <future>
#include <stdexcept>

namespace pw::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

template<typename T>
struct PromisedTask : Task {
    std::promise<T> promise;

    std::future<T> getFuture() { return promise.get_future(); }
};

}
