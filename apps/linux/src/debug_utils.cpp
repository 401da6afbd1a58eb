#include "debug_utils.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>

namespace {
    std::atomic<bool> g_log_enabled{true};
    std::mutex g_log_mutex;
}

long long t_ms() {
    using namespace std::chrono;
    static auto t0 = steady_clock::now();
    auto now = steady_clock::now();
    return duration_cast<milliseconds>(now - t0).count();
}

void set_log_enabled(bool enabled) {
    g_log_enabled.store(enabled);
}

bool log_enabled() {
    return g_log_enabled.load();
}

void log_line(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[T+" << t_ms() << "ms] [" << (tag ? tag : "-") << "] "
              << msg << "\n";
}

std::string mask_secret(const std::string& secret) {
    if (secret.size() <= 2) {
        return std::string(secret.size(), '*');
    }
    return std::string(secret.size() - 2, '*') + secret.substr(secret.size() - 2);
}
