#include "respkv/util/signal_handler.hpp"

#include <signal.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace respkv::util {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<int> SignalHandler::shutdown_signal_{0};

namespace {

static_assert(std::atomic<bool>::is_always_lock_free && std::atomic<int>::is_always_lock_free,
              "flags are written from a signal handler");

// wakes waiters for request_shutdown(). a signal handler can't notify, waiters poll for those
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;
constexpr auto kPollInterval = std::chrono::milliseconds(100);

void set_disposition(void (*handler)(int)) {
    struct sigaction action {};
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

}  // namespace

void SignalHandler::on_signal(int signal) {
    int expected = 0;
    shutdown_signal_.compare_exchange_strong(expected, signal);
    shutdown_requested_.store(true);
}

void SignalHandler::install() {
    set_disposition(&SignalHandler::on_signal);
}

void SignalHandler::uninstall() {
    set_disposition(SIG_DFL);
}

bool SignalHandler::should_shutdown() {
    return shutdown_requested_.load();
}

int SignalHandler::shutdown_signal() {
    return shutdown_signal_.load();
}

void SignalHandler::wait_for_shutdown() {
    std::unique_lock lock(shutdown_mutex);
    while (!shutdown_requested_.load()) {
        shutdown_cv.wait_for(lock, kPollInterval);
    }
}

bool SignalHandler::wait_for_shutdown(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock lock(shutdown_mutex);
    while (!shutdown_requested_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        shutdown_cv.wait_for(lock, std::min<std::chrono::steady_clock::duration>(
                                           kPollInterval, deadline - now));
    }
    return true;
}

void SignalHandler::request_shutdown() {
    {
        std::lock_guard lock(shutdown_mutex);
        shutdown_requested_.store(true);
    }
    shutdown_cv.notify_all();
}

void SignalHandler::reset() {
    shutdown_requested_.store(false);
    shutdown_signal_.store(0);
}

std::string signal_name(int signal) {
    switch (signal) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "signal " + std::to_string(signal);
    }
}

}  // namespace respkv::util
