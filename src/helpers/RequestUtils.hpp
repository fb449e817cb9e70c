#pragma once

#include <string>

namespace NRequestUtils {
    std::string generateNonce();
    std::string composeUrl(bool https, const std::string& endpoint, const std::string& query);
    std::string escapeSignature(const std::string& sig);
    bool        isValidSyncLevel(const std::string& sl);
    // 0 means no timeout
    bool        isValidTimeout(int seconds);
};
