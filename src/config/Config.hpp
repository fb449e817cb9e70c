#pragma once

#include <string>
#include <vector>
#include <memory>
#include <expected>

#include "../core/Endpoints.hpp"

class CConfig {
  public:
    CConfig(const std::string& path);

    struct SConfig {
        std::string              client_id     = "";
        std::string              key           = ""; // base64, empty = unsigned requests
        std::vector<std::string> urls          = DEFAULT_ENDPOINTS;
        bool                     https         = false;
        bool                     https_verify  = true;
        bool                     timestamp     = false;
        bool                     wait_for_all  = false;
        std::string              sync_level    = "";
        int                      timeout       = 0; // seconds, 0 = unset
        bool                     trace_logging = false;
    } m_config;

    static std::expected<SConfig, std::string> parse(const std::string& jsonc);
};

inline std::unique_ptr<CConfig> g_pConfig;
