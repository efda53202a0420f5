#pragma once

#include <functional>
#include <mutex>
#include <utility>

namespace sqlguard {

/**
 * @brief Per-request cancellation signal
 *
 * The executor registers a hook (the connection's server-side cancel)
 * while a statement runs; cancel() invokes it from whichever thread
 * observed the disconnect. A hook registered after cancel() fires at once.
 */
class CancellationToken {
public:
    using Hook = std::function<bool()>;

    void cancel() {
        Hook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) return;
            cancelled_ = true;
            hook = hook_;
        }
        if (hook) hook();
    }

    [[nodiscard]] bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    void register_hook(Hook hook) {
        bool fire_now = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook_ = hook;
            fire_now = cancelled_;
        }
        if (fire_now && hook) hook();
    }

    void clear_hook() {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = nullptr;
    }

    /**
     * @brief Keeps a hook registered for one scope
     */
    class ScopedHook {
    public:
        ScopedHook(CancellationToken* token, Hook hook) : token_(token) {
            if (token_ && hook) token_->register_hook(std::move(hook));
        }
        ~ScopedHook() {
            if (token_) token_->clear_hook();
        }

        ScopedHook(const ScopedHook&) = delete;
        ScopedHook& operator=(const ScopedHook&) = delete;

    private:
        CancellationToken* token_;
    };

private:
    mutable std::mutex mutex_;
    bool cancelled_ = false;
    Hook hook_;
};

} // namespace sqlguard
