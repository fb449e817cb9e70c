#include "Request.hpp"

#include "Crypto.hpp"
#include "../helpers/RequestUtils.hpp"
#include "../debug/log.hpp"

#include <fmt/format.h>

CValidationRequest::CValidationRequest(const std::string& clientId, const std::string& otp, const CCrypto& crypto, const SRequestOptions& opts, const std::string& nonce) {
    m_params["id"]    = clientId;
    m_params["otp"]   = otp;
    m_params["nonce"] = nonce.empty() ? NRequestUtils::generateNonce() : nonce;

    if (opts.timestamp)
        m_params["timestamp"] = "1";
    if (!opts.syncLevel.empty())
        m_params["sl"] = opts.syncLevel;
    if (opts.timeoutSeconds.has_value() && *opts.timeoutSeconds > 0)
        m_params["timeout"] = std::to_string(*opts.timeoutSeconds);

    for (const auto& [k, v] : m_params) {
        if (!m_query.empty())
            m_query += "&";
        m_query += fmt::format("{}={}", k, v);
    }

    if (!crypto.hasKey())
        return;

    m_signature = crypto.sign(m_query);

    if (m_signature.empty()) {
        Debug::log(ERR, "CValidationRequest: failed to sign the request, sending it unsigned");
        return;
    }

    m_query += "&h=" + NRequestUtils::escapeSignature(m_signature);
}

std::string CValidationRequest::otp() const {
    return m_params.at("otp");
}

std::string CValidationRequest::nonce() const {
    return m_params.at("nonce");
}

std::string CValidationRequest::query() const {
    return m_query;
}

std::string CValidationRequest::signature() const {
    return m_signature;
}

const std::map<std::string, std::string>& CValidationRequest::params() const {
    return m_params;
}
