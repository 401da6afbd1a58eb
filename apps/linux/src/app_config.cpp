#include "app_config.h"
#include "debug_utils.h"
#include <cstdlib>
#include <limits>

namespace {
    const char* process_env(const char* name) {
        return std::getenv(name);
    }

    bool parse_port(const std::string& s, uint16_t& out) {
        if (s.empty()) return false;
        char* end = nullptr;
        long v = std::strtol(s.c_str(), &end, 10);
        if (*end != '\0' || v <= 0 || v > std::numeric_limits<uint16_t>::max()) {
            return false;
        }
        out = static_cast<uint16_t>(v);
        return true;
    }

    std::string strip_trailing_slash(std::string s) {
        while (!s.empty() && s.back() == '/') {
            s.pop_back();
        }
        return s;
    }
}

std::string AppConfig::endpoint_url() const {
    return base_url + ":" + std::to_string(port);
}

AppConfig load_app_config(const IniFile& ini, EnvLookup env) {
    if (!env) {
        env = process_env;
    }

    AppConfig cfg;
    cfg.base_url = strip_trailing_slash(ini.get_or("backend", "base_url", cfg.base_url));

    uint16_t port = 0;
    if (parse_port(ini.get_or("backend", "port", ""), port)) {
        cfg.port = port;
    }

    cfg.adapter     = ini.get_or("device", "adapter", cfg.adapter);
    cfg.name_prefix = ini.get_or("device", "name_prefix", cfg.name_prefix);
    cfg.scan_ms     = static_cast<int>(ini.get_int_or("device", "scan_ms", cfg.scan_ms));
    if (cfg.scan_ms <= 0) {
        cfg.scan_ms = 5000;
    }

    cfg.download_dir     = ini.get_or("transfer", "download_dir", cfg.download_dir);
    cfg.retry_backoff_ms = static_cast<int>(
        ini.get_int_or("transfer", "retry_backoff_ms", cfg.retry_backoff_ms));
    if (cfg.retry_backoff_ms < 0) {
        cfg.retry_backoff_ms = 0;
    }

    // Both variables must be present for the override to apply
    const char* env_base = env("CAMFC_BASE");
    const char* env_port = env("CAMFC_PORT");
    if (env_base && env_port && *env_base) {
        uint16_t p = 0;
        if (parse_port(env_port, p)) {
            cfg.base_url = strip_trailing_slash(env_base);
            cfg.port = p;
            PLOG("config", "backend from environment: " << cfg.endpoint_url());
        } else {
            PLOG("config", "ignoring CAMFC_PORT=" << env_port);
        }
    }

    return cfg;
}
