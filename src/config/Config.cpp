#include "Config.hpp"

#include <glaze/glaze.hpp>
#include <fmt/format.h>

#include "../helpers/FsUtils.hpp"
#include "../helpers/RequestUtils.hpp"

#include "../debug/log.hpp"

std::expected<CConfig::SConfig, std::string> CConfig::parse(const std::string& jsonc) {
    auto json = glz::read_jsonc<SConfig>(jsonc);

    if (!json.has_value())
        return std::unexpected(glz::format_error(json.error(), jsonc));

    SConfig cfg = json.value();

    if (cfg.client_id.empty())
        return std::unexpected("client_id is required");

    if (cfg.urls.empty())
        return std::unexpected("urls must name at least one endpoint");

    if (!NRequestUtils::isValidTimeout(cfg.timeout))
        return std::unexpected(fmt::format("timeout {} is out of range", cfg.timeout));

    return cfg;
}

CConfig::CConfig(const std::string& path) {
    const auto CONTENTS = NFsUtils::readFileAsString(NFsUtils::absolutePath(path));

    if (!CONTENTS.has_value())
        Debug::die("No config at {}", path);

    auto cfg = parse(CONTENTS.value());

    if (!cfg.has_value())
        Debug::die("Config has bad format: {}", cfg.error());

    m_config = cfg.value();
}
