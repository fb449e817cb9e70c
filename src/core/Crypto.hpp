#pragma once

#include <string>
#include <expected>
#include <openssl/evp.h>

// HMAC-SHA1 signing with the shared client key, as used by the validation protocol.
class CCrypto {
  public:
    // key is raw bytes, not base64
    CCrypto(const std::string& key);

    bool        hasKey() const;

    std::string hmacSha1(const std::string& in) const;
    std::string sign(const std::string& in) const;
    bool        verifySignature(const std::string& in, const std::string& sig) const;

    static std::string                             base64Encode(const std::string& in);
    static std::expected<std::string, std::string> base64Decode(const std::string& in);
    static bool                                    constantTimeEquals(const std::string& a, const std::string& b);

  private:
    std::string m_key;
};
