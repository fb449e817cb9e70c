#include "Verifier.hpp"

#include "Endpoints.hpp"
#include "Racer.hpp"
#include "Request.hpp"
#include "../net/PistacheFetcher.hpp"
#include "../debug/log.hpp"

#include <stdexcept>

CVerifier::CVerifier(const std::string& clientId, const std::string& key, bool https, bool httpsVerify, std::shared_ptr<IFetcher> fetcher) :
    m_clientId(clientId), m_https(https), m_httpsVerify(httpsVerify), m_fetcher(fetcher), m_endpoints(DEFAULT_ENDPOINTS) {
    const auto RAWKEY = CCrypto::base64Decode(key);

    if (!RAWKEY.has_value()) {
        Debug::log(CRIT, "CVerifier: client key is not valid base64: {}", RAWKEY.error());
        throw std::runtime_error("Bad client key");
    }

    m_crypto = std::make_unique<CCrypto>(RAWKEY.value());

    if (!m_fetcher)
        m_fetcher = std::make_shared<CPistacheFetcher>();

    if (!m_crypto->hasKey())
        Debug::log(WARN, "CVerifier: no client key, requests and responses will not be signed");
}

SVerifyResult CVerifier::verify(const std::string& token, const SVerifyOptions& opts) const {
    const auto PARSED = parseToken(token);

    if (!PARSED.has_value()) {
        Debug::log(LOG, "verify: could not parse the otp");
        return SVerifyResult{.verdict = VERDICT_PARSE_FAILURE};
    }

    const CValidationRequest REQUEST(m_clientId, PARSED->otp(), *m_crypto,
                                     SRequestOptions{.timestamp = opts.useTimestamp, .syncLevel = opts.syncLevel, .timeoutSeconds = opts.timeoutSeconds});

    const CValidationRacer   RACER(*m_fetcher, *m_crypto);

    auto                     result = RACER.race(REQUEST, endpoints(),
                                                 SRaceOptions{.https = m_https, .verifyTls = m_httpsVerify, .waitForAll = opts.waitForAll, .timeoutSeconds = opts.timeoutSeconds});

    Debug::log(LOG, "verify: {} for otp with prefix {} ({} answer(s), {} transport failure(s))", verdictToString(result), PARSED->prefix(), result.bodies,
               result.transportFailures);

    return result;
}

std::optional<COTPToken> CVerifier::parseToken(const std::string& raw, const std::string& delim) const {
    COTPToken token(raw, delim);

    if (!token.valid())
        return std::nullopt;

    return token;
}

void CVerifier::setEndpoints(const std::vector<std::string>& endpoints) {
    std::lock_guard<std::mutex> lg(m_endpointsMutex);
    m_endpoints = endpoints;
}

std::vector<std::string> CVerifier::endpoints() const {
    std::lock_guard<std::mutex> lg(m_endpointsMutex);
    return m_endpoints;
}

std::string CVerifier::clientId() const {
    return m_clientId;
}

bool CVerifier::hasKey() const {
    return m_crypto->hasKey();
}
