#ifndef RESPKV_UTIL_SIGNAL_HANDLER_HPP
#define RESPKV_UTIL_SIGNAL_HANDLER_HPP

#include <atomic>
#include <chrono>
#include <string>

namespace respkv::util {

/*
    process-wide shutdown latch for respkv-server.
    SIGINT and SIGTERM only flip an atomic (nothing else is safe inside a handler); the main
    thread parks in wait_for_shutdown() and then stops the server.
*/
class SignalHandler {
   public:
    // route SIGINT and SIGTERM to the latch. calling it again is harmless
    static void install();
    // back to SIG_DFL for both
    static void uninstall();

    static bool should_shutdown();
    // first SIGINT/SIGTERM received since the last reset(), 0 if none
    static int shutdown_signal();

    static void wait_for_shutdown();
    // false if the timeout ran out first
    static bool wait_for_shutdown(std::chrono::milliseconds timeout);

    // trip the latch from normal code (tests, embedding)
    static void request_shutdown();
    static void reset();

   private:
    // touches nothing but lock-free atomics
    static void on_signal(int signal);

    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> shutdown_signal_;
};

// "SIGINT", "SIGTERM", otherwise "signal <n>"
std::string signal_name(int signal);

}  // namespace respkv::util

#endif
