#include "qtop/cancel.h"

#include <cstring>
#include <stdexcept>
#include <string>

#include <signal.h>

namespace qtop {
namespace {

std::atomic<CancelTokenV1*> g_token{nullptr};

void on_cancel_signal(int signo) {
    CancelTokenV1* t = g_token.load(std::memory_order_acquire);
    if (t) t->cancel(signo);
}

void set_handler(int signo, void (*fn)(int)) {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = fn;
    sigemptyset(&sa.sa_mask);
    if (sigaction(signo, &sa, nullptr) != 0) {
        throw std::runtime_error("sigaction failed for signal " + std::to_string(signo));
    }
}

}  // namespace

void install_signal_cancel_v1(CancelTokenV1* token) {
    if (!token) throw std::runtime_error("install_signal_cancel_v1: null token");
    g_token.store(token, std::memory_order_release);
    set_handler(SIGINT, on_cancel_signal);
    set_handler(SIGTERM, on_cancel_signal);
}

void uninstall_signal_cancel_v1() {
    set_handler(SIGINT, SIG_DFL);
    set_handler(SIGTERM, SIG_DFL);
    g_token.store(nullptr, std::memory_order_release);
}

bool signal_cancel_installed_v1() { return g_token.load(std::memory_order_acquire) != nullptr; }

}  // namespace qtop
