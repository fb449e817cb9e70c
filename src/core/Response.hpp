#pragma once

#include <string>
#include <map>
#include <cstdint>
#include <optional>
#include <set>

class CCrypto;

enum eResponseKind : uint8_t {
    RESPONSE_IRRELEVANT = 0, // no status line at all
    RESPONSE_MISMATCH,       // otp or nonce not echoed back
    RESPONSE_BAD_SIGNATURE,  // signature missing or wrong, or a signed field given twice
    RESPONSE_OK,
    RESPONSE_REPLAYED,
    RESPONSE_OTHER_STATUS,
};

class CValidationResponse {
  public:
    CValidationResponse(const std::string& body, const std::string& otp, const std::string& nonce, const CCrypto& crypto);

    eResponseKind                             kind() const;
    std::string                               status() const;
    std::optional<std::string>                field(const std::string& name) const;
    const std::map<std::string, std::string>& fields() const;

    // OK or REPLAYED_OTP, passed relevance and signature checks
    bool                                      decisive() const;

    // names that occur more than once go to repeated, the last occurrence wins in the map
    static std::map<std::string, std::string> parseFields(const std::string& body, std::set<std::string>* repeated = nullptr);
    static std::string                        checkString(const std::map<std::string, std::string>& fields);

  private:
    std::map<std::string, std::string> m_fields;
    std::string                        m_status;
    eResponseKind                      m_kind = RESPONSE_IRRELEVANT;
};

const char* responseKindToString(eResponseKind kind);
