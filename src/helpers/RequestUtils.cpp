#include "RequestUtils.hpp"

#include <algorithm>
#include <cctype>
#include <array>
#include <cstdint>
#include <mutex>
#include <random>
#include <sstream>

#include <fmt/format.h>

constexpr const int MAX_TIMEOUT_S = 3600;

// Only echoed back by the server to pair responses with requests, does not need to be secret.
std::string NRequestUtils::generateNonce() {
    static std::random_device dev;
    static std::mutex         devMutex;

    // one 32 bit draw per output word, so the engine state is as wide as the nonce
    std::array<uint32_t, 4> seed;
    {
        std::lock_guard<std::mutex> lg(devMutex);
        for (auto& s : seed) {
            s = dev();
        }
    }

    std::seed_seq                           seq(seed.begin(), seed.end());
    std::mt19937                            engine(seq);
    std::uniform_int_distribution<uint32_t> distribution;

    std::stringstream                       ss;
    for (size_t i = 0; i < 4; ++i) {
        ss << fmt::format("{:08x}", distribution(engine));
    }

    return ss.str();
}

std::string NRequestUtils::composeUrl(bool https, const std::string& endpoint, const std::string& query) {
    return fmt::format("{}://{}?{}", https ? "https" : "http", endpoint, query);
}

std::string NRequestUtils::escapeSignature(const std::string& sig) {
    std::string cpy = sig;
    size_t      pos = 0;
    while ((pos = cpy.find('+', pos)) != std::string::npos) {
        cpy.replace(pos, 1, "%2B");
        pos += 3;
    }

    return cpy;
}

bool NRequestUtils::isValidSyncLevel(const std::string& sl) {
    if (sl == "fast" || sl == "secure")
        return true;

    if (sl.empty() || sl.size() > 3 || !std::all_of(sl.begin(), sl.end(), ::isdigit))
        return false;

    return std::stoi(sl) <= 100;
}

bool NRequestUtils::isValidTimeout(int seconds) {
    return seconds >= 0 && seconds <= MAX_TIMEOUT_S;
}
