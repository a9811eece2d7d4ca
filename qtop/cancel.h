#pragma once

#include <atomic>

namespace qtop {

// Cancellation flag shared between the scheduler and the process signal handler.
// Only lock-free atomic operations are used, so cancel() is async-signal-safe.
class CancelTokenV1 {
   public:
    CancelTokenV1() = default;
    CancelTokenV1(const CancelTokenV1&) = delete;
    CancelTokenV1& operator=(const CancelTokenV1&) = delete;

    // signo == 0 records a programmatic cancel (no signal involved).
    void cancel(int signo = 0) {
        signo_.store(signo, std::memory_order_relaxed);
        cancelled_.store(true, std::memory_order_release);
    }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    int signal() const { return signo_.load(std::memory_order_relaxed); }

   private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int> signo_{0};
};

// Route SIGINT and SIGTERM to `token`. Only one token can be installed per process;
// installing again replaces the previous one.
void install_signal_cancel_v1(CancelTokenV1* token);

// Restore default dispositions for SIGINT and SIGTERM and detach the token.
void uninstall_signal_cancel_v1();

// True while a token is installed.
bool signal_cancel_installed_v1();

// Installs for the lifetime of the guard. Outside such a scope SIGINT/SIGTERM
// keep their default action and terminate the process.
class ScopedSignalCancelV1 {
   public:
    explicit ScopedSignalCancelV1(CancelTokenV1* token) { install_signal_cancel_v1(token); }
    ~ScopedSignalCancelV1() { uninstall_signal_cancel_v1(); }
    ScopedSignalCancelV1(const ScopedSignalCancelV1&) = delete;
    ScopedSignalCancelV1& operator=(const ScopedSignalCancelV1&) = delete;
};

}  // namespace qtop
