// signals.cpp - SIGINT/SIGTERM to cooperative cancellation.

#include "system/signals.hpp"

#include <csignal>
#include <cstring>

namespace splitpack {

std::atomic_bool g_cancel{false};

namespace {
volatile std::sig_atomic_t g_last_signal = 0;

void HandleSignal(int sig) {
    g_last_signal = sig;
    g_cancel.store(true, std::memory_order_relaxed);
}
} // namespace

void InstallSignalHandlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int LastSignal() {
    return static_cast<int>(g_last_signal);
}

} // namespace splitpack
