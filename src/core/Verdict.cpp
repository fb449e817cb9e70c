#include "Verdict.hpp"

#include "Response.hpp"

#include <re2/re2.h>

bool SVerifyResult::ok() const {
    return verdict == VERDICT_VALID;
}

std::expected<std::map<std::string, std::string>, std::string> SVerifyResult::parameters(const std::vector<std::string>& names) const {
    static const std::vector<std::string> DEFAULT_NAMES = {"timestamp", "sessioncounter", "sessionuse"};

    std::map<std::string, std::string>    params;

    for (const auto& n : names.empty() ? DEFAULT_NAMES : names) {
        const RE2   RE(RE2::QuoteMeta(n) + "=([0-9]+)");
        std::string value;

        if (!RE2::PartialMatch(lastResponse, RE, &value))
            return std::unexpected("Could not parse parameter \"" + n + "\" from response.");

        params[n] = value;
    }

    return params;
}

void SRaceTally::add(const CValidationResponse& response) {
    bodies++;

    if (anyStatus.empty())
        anyStatus = response.status();

    switch (response.kind()) {
        case RESPONSE_OK: valid = true; break;
        case RESPONSE_REPLAYED: replayed = true; break;
        case RESPONSE_OTHER_STATUS:
            if (otherStatus.empty())
                otherStatus = response.status();
            break;
        default: break;
    }
}

void SRaceTally::addFailure() {
    failures++;
}

void NResultPolicy::conclude(const SRaceTally& tally, SVerifyResult& result) {
    result.bodies            = tally.bodies;
    result.transportFailures = tally.failures;

    // a replay is authoritative, even if another server said OK
    if (tally.replayed) {
        result.verdict = VERDICT_REPLAYED;
        result.status  = "REPLAYED_OTP";
    } else if (tally.valid) {
        result.verdict = VERDICT_VALID;
        result.status  = "OK";
    } else if (!tally.otherStatus.empty()) {
        result.verdict = VERDICT_SERVER_ERROR;
        result.status  = tally.otherStatus;
    } else if (tally.bodies > 0) {
        result.verdict = VERDICT_NO_DECISIVE_ANSWER;
        result.status  = tally.anyStatus;
    } else
        result.verdict = VERDICT_TRANSPORT_FAILURE;
}

std::string verdictToString(const SVerifyResult& result) {
    switch (result.verdict) {
        case VERDICT_VALID: return "OK";
        case VERDICT_REPLAYED: return "REPLAYED_OTP";
        case VERDICT_SERVER_ERROR: return result.status;
        case VERDICT_NO_DECISIVE_ANSWER: return "NO_VALID_ANSWER";
        case VERDICT_TRANSPORT_FAILURE: return "TRANSPORT_FAILURE";
        case VERDICT_PARSE_FAILURE: return "BAD_OTP_FORMAT";
    }

    return "ERROR";
}
