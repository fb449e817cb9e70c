#pragma once

#include <string>
#include <vector>
#include <optional>

#include "Verdict.hpp"

class IFetcher;
class CCrypto;
class CValidationRequest;

struct SRaceOptions {
    bool               https      = false;
    bool               verifyTls  = true;
    bool               waitForAll = false;
    std::optional<int> timeoutSeconds;
};

// Sends one request to every endpoint at once and settles on the first decisive answer.
class CValidationRacer {
  public:
    CValidationRacer(IFetcher& fetcher, const CCrypto& crypto);

    SVerifyResult race(const CValidationRequest& request, const std::vector<std::string>& endpoints, const SRaceOptions& opts) const;

  private:
    IFetcher&      m_fetcher;
    const CCrypto& m_crypto;
};
