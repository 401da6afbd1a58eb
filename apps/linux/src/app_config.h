#pragma once
#include "ini_store.h"
#include <cstdint>
#include <string>

// Runtime settings, read from the INI file with CAMFC_BASE / CAMFC_PORT
// taking precedence for the storage endpoint.
struct AppConfig {
    std::string base_url        = "http://localhost";
    uint16_t    port            = 8005;

    std::string adapter         = "hci0";
    std::string name_prefix     = "cpen";
    int         scan_ms         = 5000;

    std::string download_dir    = "data/downloads";
    int         retry_backoff_ms = 1000;

    // "<base_url>:<port>"
    std::string endpoint_url() const;
};

// 'env' defaults to the process environment; tests pass their own lookup.
using EnvLookup = const char* (*)(const char*);

AppConfig load_app_config(const IniFile& ini, EnvLookup env = nullptr);
