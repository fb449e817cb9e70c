#include "Response.hpp"

#include "Crypto.hpp"
#include "../debug/log.hpp"

#include <algorithm>
#include <array>
#include <string_view>

#include <re2/re2.h>

// Fields covered by the server signature, sorted.
constexpr const std::array<const char*, 9> SIGNED_FIELDS = {"nonce", "otp", "sessioncounter", "sessionuse", "sl", "status", "t", "timeout", "timestamp"};

static std::string_view trim(std::string_view sv) {
    constexpr const char* WS = " \t\r\n\v";
    const auto            B  = sv.find_first_not_of(WS, 0);
    if (B == std::string_view::npos)
        return {};
    return sv.substr(B, sv.find_last_not_of(WS) - B + 1);
}

std::map<std::string, std::string> CValidationResponse::parseFields(const std::string& body, std::set<std::string>* repeated) {
    std::map<std::string, std::string> fields;

    const auto                         BODY = trim(body);
    size_t                             pos  = 0;

    while (pos <= BODY.size()) {
        auto end = BODY.find('\n', pos);
        if (end == std::string_view::npos)
            end = BODY.size();

        auto line = BODY.substr(pos, end - pos);
        if (line.ends_with('\r'))
            line.remove_suffix(1);

        pos = end + 1;

        // only the first = separates, base64 values end in =
        const auto EQ = line.find('=');
        if (EQ == std::string_view::npos)
            continue;

        const std::string NAME{line.substr(0, EQ)};
        if (repeated && fields.contains(NAME))
            repeated->insert(NAME);

        fields[NAME] = std::string{line.substr(EQ + 1)};
    }

    return fields;
}

std::string CValidationResponse::checkString(const std::map<std::string, std::string>& fields) {
    std::string check;

    for (const auto& f : SIGNED_FIELDS) {
        const auto IT = fields.find(f);
        if (IT == fields.end())
            continue;

        if (!check.empty())
            check += "&";
        check += std::string{f} + "=" + IT->second;
    }

    return check;
}

CValidationResponse::CValidationResponse(const std::string& body, const std::string& otp, const std::string& nonce, const CCrypto& crypto) {
    static const RE2 STATUS_RE("status=([a-zA-Z0-9_]+)");
    static const RE2 STATUS_VALUE_RE("[a-zA-Z0-9_]+");

    if (!RE2::PartialMatch(body, STATUS_RE))
        return;

    std::set<std::string> repeated;
    m_fields = parseFields(body, &repeated);

    // classify on the parsed field, which is the one the signature covers
    const auto STATUS = field("status");
    if (!STATUS.has_value() || !RE2::FullMatch(*STATUS, STATUS_VALUE_RE)) {
        Debug::log(TRACE, "CValidationResponse: no usable status field");
        return;
    }

    m_status = *STATUS;

    // a repeated field leaves it open which copy was signed
    const bool AMBIGUOUS =
        repeated.contains("h") || std::any_of(SIGNED_FIELDS.begin(), SIGNED_FIELDS.end(), [&repeated](const char* f) { return repeated.contains(f); });

    if (AMBIGUOUS && !crypto.hasKey()) {
        Debug::log(WARN, "CValidationResponse: response repeats a field, ignoring status {}", m_status);
        m_kind = RESPONSE_MISMATCH;
        return;
    }

    const auto OTP   = field("otp");
    const auto NONCE = field("nonce");

    if (!OTP.has_value() || *OTP != otp || !NONCE.has_value() || *NONCE != nonce) {
        Debug::log(TRACE, "CValidationResponse: otp or nonce mismatch, ignoring status {}", m_status);
        m_kind = RESPONSE_MISMATCH;
        return;
    }

    if (crypto.hasKey()) {
        const auto H = field("h");
        if (AMBIGUOUS || !H.has_value() || !crypto.verifySignature(checkString(m_fields), *H)) {
            Debug::log(WARN, "CValidationResponse: signature mismatch on a response with status {}", m_status);
            m_kind = RESPONSE_BAD_SIGNATURE;
            return;
        }
    }

    if (m_status == "OK")
        m_kind = RESPONSE_OK;
    else if (m_status == "REPLAYED_OTP")
        m_kind = RESPONSE_REPLAYED;
    else
        m_kind = RESPONSE_OTHER_STATUS;
}

eResponseKind CValidationResponse::kind() const {
    return m_kind;
}

std::string CValidationResponse::status() const {
    return m_status;
}

std::optional<std::string> CValidationResponse::field(const std::string& name) const {
    const auto IT = m_fields.find(name);
    if (IT == m_fields.end())
        return std::nullopt;
    return IT->second;
}

const std::map<std::string, std::string>& CValidationResponse::fields() const {
    return m_fields;
}

bool CValidationResponse::decisive() const {
    return m_kind == RESPONSE_OK || m_kind == RESPONSE_REPLAYED;
}

const char* responseKindToString(eResponseKind kind) {
    switch (kind) {
        case RESPONSE_IRRELEVANT: return "IRRELEVANT";
        case RESPONSE_MISMATCH: return "MISMATCH";
        case RESPONSE_BAD_SIGNATURE: return "BAD_SIGNATURE";
        case RESPONSE_OK: return "OK";
        case RESPONSE_REPLAYED: return "REPLAYED";
        case RESPONSE_OTHER_STATUS: return "OTHER_STATUS";
    }

    return "ERROR";
}
