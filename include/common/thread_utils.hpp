#pragma once

#include "common/errors.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>

// Set-once cancellation flag shared between the caller that starts a run and
// the pipeline. It is never cleared while a run is in progress.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    void throwIfCancelled(const std::string& where = "Backup cancelled by user.") const {
        if (isCancelled()) {
            throw CancelledError(where);
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};

using Timeout = std::optional<std::chrono::milliseconds>;

class ThreadUtils {
public:
    static void sleepFor(std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    }

    // Runs func on a helper thread and waits at most `timeout` for it.
    // An empty timeout calls func inline with no bound. When the bound
    // expires a TimeoutFailure is thrown and the helper thread is left
    // behind: a call blocked on a dead mount cannot be interrupted safely.
    // Everything func touches must therefore be owned by func itself.
    template<typename Func>
    static typename std::result_of<Func()>::type
    runWithTimeout(const std::string& operation, Func func, Timeout timeout) {
        using return_type = typename std::result_of<Func()>::type;

        if (!timeout) {
            return func();
        }

        auto promise = std::make_shared<std::promise<return_type>>();
        std::future<return_type> result = promise->get_future();

        std::thread([promise, func = std::move(func)]() mutable {
            try {
                if constexpr (std::is_void<return_type>::value) {
                    func();
                    promise->set_value();
                } else {
                    promise->set_value(func());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();

        if (result.wait_for(*timeout) == std::future_status::timeout) {
            throw TimeoutFailure(operation, *timeout);
        }
        return result.get();
    }
};
