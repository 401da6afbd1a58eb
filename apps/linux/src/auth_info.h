#pragma once
#include <string>

// Bearer credential sent with every storage request
struct AuthInfo {
    std::string device_id;
    std::string totp;

    // Compact JSON: {"Id":"<device id>","Totp":"<code>"}
    std::string header_value() const;
};
