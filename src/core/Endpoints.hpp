#pragma once

#include <string>
#include <vector>

// host/path parts, the scheme is picked per verifier
inline const std::vector<std::string> DEFAULT_ENDPOINTS = {
    "api.yubico.com/wsapi/2.0/verify",  "api2.yubico.com/wsapi/2.0/verify", "api3.yubico.com/wsapi/2.0/verify",
    "api4.yubico.com/wsapi/2.0/verify", "api5.yubico.com/wsapi/2.0/verify",
};
