#pragma once
#include <sstream>
#include <string>

// Milliseconds since the first call (process-relative timestamps for logs)
long long t_ms();

// Master switch, on by default. The CLI --quiet flag and the tests turn it off.
void set_log_enabled(bool enabled);
bool log_enabled();

// Writes "[T+<ms>ms] [tag] msg" to stderr, serialised across threads.
void log_line(const char* tag, const std::string& msg);

// Keeps only the last two characters of a one-time code for logs
std::string mask_secret(const std::string& secret);

#define PLOG(tag, expr)                         \
    do {                                        \
        if (log_enabled()) {                    \
            std::ostringstream plog_oss_;       \
            plog_oss_ << expr;                  \
            log_line(tag, plog_oss_.str());     \
        }                                       \
    } while (0)
