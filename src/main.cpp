#include <iostream>
#include <optional>

#include "debug/log.hpp"

#include "core/Verifier.hpp"
#include "helpers/RequestUtils.hpp"

#include "config/Config.hpp"

constexpr const int RET_VALID      = 0;
constexpr const int RET_FAILURE    = 1;
constexpr const int RET_REPLAYED   = 2;
constexpr const int RET_BAD_FORMAT = 3;

static void printHelp() {
    std::cout << "otpverify -c [config] [options] [otp]\n"
                 "  -c, --config [path]   config file (jsonc)\n"
                 "  --timestamp           ask for timestamp and session counters\n"
                 "  --wait-for-all        wait for every server, print all answers\n"
                 "  --sl [level]          sync level, 0-100, fast or secure\n"
                 "  --timeout [seconds]   per-server timeout\n"
                 "  --parse               only parse the otp\n"
                 "  --trace               verbose logging\n"
                 "  -v, --version         print the version\n";
}

int main(int argc, char** argv, char** envp) {

    std::vector<std::string> ARGS{};
    ARGS.resize(argc);
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    std::vector<std::string> command;
    std::string              configPath;
    std::optional<bool>      timestampOverride, waitForAllOverride;
    std::optional<int>       timeoutOverride;
    std::string              slOverride;
    bool                     parseOnly = false, trace = false;

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i].starts_with("-")) {
            if (ARGS[i] == "--help" || ARGS[i] == "-h") {
                printHelp();
                return 0;
            } else if (ARGS[i] == "--version" || ARGS[i] == "-v") {
                std::cout << "otpverify " << OTPVERIFY_VERSION << "\n";
                return 0;
            } else if ((ARGS[i] == "--config" || ARGS[i] == "-c") && i + 1 < argc) {
                configPath = ARGS[i + 1];
                i++;
            } else if (ARGS[i] == "--timestamp") {
                timestampOverride = true;
            } else if (ARGS[i] == "--wait-for-all") {
                waitForAllOverride = true;
            } else if (ARGS[i] == "--sl" && i + 1 < argc) {
                slOverride = ARGS[i + 1];
                i++;
            } else if (ARGS[i] == "--timeout" && i + 1 < argc) {
                try {
                    size_t    end     = 0;
                    const int SECONDS = std::stoi(ARGS[i + 1], &end);
                    if (end != ARGS[i + 1].size() || !NRequestUtils::isValidTimeout(SECONDS))
                        throw std::out_of_range("timeout");
                    timeoutOverride = SECONDS;
                } catch (std::exception& e) {
                    std::cerr << "Invalid timeout " << ARGS[i + 1] << "\n";
                    return RET_FAILURE;
                }
                i++;
            } else if (ARGS[i] == "--parse") {
                parseOnly = true;
            } else if (ARGS[i] == "--trace") {
                trace = true;
            } else {
                std::cerr << "Unrecognized / invalid use of option " << ARGS[i] << "\nContinuing...\n";
                continue;
            }
        } else
            command.push_back(ARGS[i]);
    }

    if (command.size() != 1) {
        printHelp();
        return RET_FAILURE;
    }

    const auto& OTP = command.front();

    if (parseOnly) {
        const COTPToken TOKEN(OTP);
        if (!TOKEN.valid()) {
            std::cout << "BAD_OTP_FORMAT\n";
            return RET_BAD_FORMAT;
        }

        std::cout << "password: " << (TOKEN.hasPassword() ? TOKEN.password() : "<none>") << "\nprefix: " << TOKEN.prefix() << "\nciphertext: " << TOKEN.ciphertext()
                  << "\notp: " << TOKEN.otp() << "\n";
        return RET_VALID;
    }

    if (configPath.empty()) {
        Debug::log(CRIT, "Missing param for the config file");
        return RET_FAILURE;
    }

    g_pConfig = std::make_unique<CConfig>(configPath);

    if (trace)
        g_pConfig->m_config.trace_logging = true;

    const auto& CFG = g_pConfig->m_config;

    SVerifyOptions opts;
    opts.useTimestamp = timestampOverride.value_or(CFG.timestamp);
    opts.waitForAll   = waitForAllOverride.value_or(CFG.wait_for_all);
    opts.syncLevel    = slOverride.empty() ? CFG.sync_level : slOverride;
    if (timeoutOverride.has_value() || CFG.timeout > 0)
        opts.timeoutSeconds = timeoutOverride.value_or(CFG.timeout);

    if (!opts.syncLevel.empty() && !NRequestUtils::isValidSyncLevel(opts.syncLevel)) {
        Debug::log(CRIT, "Invalid sync level {}", opts.syncLevel);
        return RET_FAILURE;
    }

    if (CFG.https)
        Debug::log(WARN, "https is enabled, but the pistache transport only speaks http. Every request will fail.");

    std::unique_ptr<CVerifier> verifier;

    try {
        verifier = std::make_unique<CVerifier>(CFG.client_id, CFG.key, CFG.https, CFG.https_verify);
    } catch (std::exception& e) {
        Debug::log(CRIT, "Couldn't set up the verifier: {}", e.what());
        return RET_FAILURE;
    }

    verifier->setEndpoints(CFG.urls);

    const auto RESULT = verifier->verify(OTP, opts);

    Debug::log(TRACE, "Query: {}", RESULT.lastQuery);
    Debug::log(TRACE, "Response: {}", RESULT.lastResponse);

    std::cout << verdictToString(RESULT) << "\n";

    if (opts.waitForAll)
        std::cout << RESULT.lastResponse;

    if (RESULT.ok() && opts.useTimestamp) {
        const auto PARAMS = RESULT.parameters();
        if (PARAMS.has_value()) {
            for (const auto& [k, v] : PARAMS.value()) {
                std::cout << k << ": " << v << "\n";
            }
        } else
            Debug::log(WARN, "{}", PARAMS.error());
    }

    switch (RESULT.verdict) {
        case VERDICT_VALID: return RET_VALID;
        case VERDICT_REPLAYED: return RET_REPLAYED;
        case VERDICT_PARSE_FAILURE: return RET_BAD_FORMAT;
        default: break;
    }

    return RET_FAILURE;
}
