#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <expected>

class CValidationResponse;

enum eVerdict : uint8_t {
    VERDICT_VALID = 0,
    VERDICT_REPLAYED,
    VERDICT_SERVER_ERROR,
    VERDICT_NO_DECISIVE_ANSWER,
    VERDICT_TRANSPORT_FAILURE,
    VERDICT_PARSE_FAILURE,
};

// Outcome of one verify() call, including that call's diagnostics.
struct SVerifyResult {
    eVerdict    verdict = VERDICT_NO_DECISIVE_ANSWER;
    std::string status; // server status the verdict is based on, may be empty

    std::string lastQuery;    // every URL tried, space separated
    std::string lastResponse; // the decisive body, or all bodies tagged with URL= when waiting for all

    size_t      bodies            = 0;
    size_t      transportFailures = 0;

    bool        ok() const;

    // Numeric fields from lastResponse. Empty names = timestamp, sessioncounter, sessionuse.
    std::expected<std::map<std::string, std::string>, std::string> parameters(const std::vector<std::string>& names = {}) const;
};

// What the race saw, fed response by response.
struct SRaceTally {
    bool        replayed = false;
    bool        valid    = false;
    std::string otherStatus; // first authentic status that was neither OK nor REPLAYED_OTP
    std::string anyStatus;   // first status seen in any body
    size_t      bodies   = 0;
    size_t      failures = 0;

    void        add(const CValidationResponse& response);
    void        addFailure();
};

namespace NResultPolicy {
    void conclude(const SRaceTally& tally, SVerifyResult& result);
};

std::string verdictToString(const SVerifyResult& result);
