#include "auth_info.h"
#include <nlohmann/json.hpp>

std::string AuthInfo::header_value() const {
    nlohmann::json j;
    j["Id"] = device_id;
    j["Totp"] = totp;
    return j.dump();
}
