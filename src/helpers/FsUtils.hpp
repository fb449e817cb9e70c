#pragma once

#include <string>
#include <expected>

namespace NFsUtils {
    std::expected<std::string, std::string> readFileAsString(const std::string& path);
    std::string                             absolutePath(const std::string& path);
};
