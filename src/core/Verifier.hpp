#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>

#include "Crypto.hpp"
#include "Token.hpp"
#include "Verdict.hpp"

class IFetcher;

struct SVerifyOptions {
    bool               useTimestamp = false;
    bool               waitForAll   = false; // debugging aid, collects every answer
    std::string        syncLevel    = "";    // 0-100, "fast" or "secure"
    std::optional<int> timeoutSeconds;
};

// Validates OTPs against a set of redundant validation servers.
// verify() may be called from several threads at once, each call gets its own diagnostics.
class CVerifier {
  public:
    // key is the base64 client key as handed out with the client id, may be empty
    CVerifier(const std::string& clientId, const std::string& key = "", bool https = false, bool httpsVerify = true, std::shared_ptr<IFetcher> fetcher = nullptr);

    SVerifyResult            verify(const std::string& token, const SVerifyOptions& opts = {}) const;
    std::optional<COTPToken> parseToken(const std::string& raw, const std::string& delim = COTPToken::DEFAULT_DELIMITER) const;

    void                     setEndpoints(const std::vector<std::string>& endpoints);
    std::vector<std::string> endpoints() const;

    std::string              clientId() const;
    bool                     hasKey() const;

  private:
    std::string               m_clientId;
    std::unique_ptr<CCrypto>  m_crypto;
    bool                      m_https       = false;
    bool                      m_httpsVerify = true;
    std::shared_ptr<IFetcher> m_fetcher;

    std::vector<std::string>  m_endpoints;
    mutable std::mutex        m_endpointsMutex;
};
