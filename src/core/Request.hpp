#pragma once

#include <string>
#include <map>
#include <optional>

class CCrypto;

struct SRequestOptions {
    bool               timestamp = false;
    std::string        syncLevel = "";
    std::optional<int> timeoutSeconds;
};

// The canonical query sent to every validation server. Parameters are kept sorted by name,
// the signature (if any) is computed over the serialized parameters and appended last as h=.
class CValidationRequest {
  public:
    CValidationRequest(const std::string& clientId, const std::string& otp, const CCrypto& crypto, const SRequestOptions& opts = {}, const std::string& nonce = "");

    std::string                               otp() const;
    std::string                               nonce() const;
    std::string                               query() const;
    std::string                               signature() const;
    const std::map<std::string, std::string>& params() const;

  private:
    std::map<std::string, std::string> m_params;
    std::string                        m_query, m_signature;
};
