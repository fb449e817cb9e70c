#include "FsUtils.hpp"

#include <filesystem>
#include <fstream>

std::expected<std::string, std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.good())
        return std::unexpected("No file");
    auto res = std::string((std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>()));
    if (!res.empty() && res.back() == '\n')
        res.pop_back();
    return res;
}

std::string NFsUtils::absolutePath(const std::string& path) {
    std::error_code ec;
    const auto      ABS = std::filesystem::absolute(path, ec);
    if (ec)
        return path;
    return ABS.string();
}
