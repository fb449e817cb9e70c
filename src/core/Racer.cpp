#include "Racer.hpp"

#include "Crypto.hpp"
#include "Request.hpp"
#include "Response.hpp"
#include "../net/Fetcher.hpp"
#include "../helpers/RequestUtils.hpp"
#include "../debug/log.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

#include <fmt/format.h>

// grace on top of the per-fetch timeout before pending fetches are given up on
constexpr const int RACE_DEADLINE_GRACE_S = 2;

namespace {
    struct SRaceState {
        std::mutex                                  mtx;
        std::condition_variable                     cv;
        std::deque<std::pair<size_t, SFetchResult>> results;
        bool                                        concluded = false;
    };
}

CValidationRacer::CValidationRacer(IFetcher& fetcher, const CCrypto& crypto) : m_fetcher(fetcher), m_crypto(crypto) {
    ;
}

SVerifyResult CValidationRacer::race(const CValidationRequest& request, const std::vector<std::string>& endpoints, const SRaceOptions& opts) const {
    SVerifyResult result;
    SRaceTally    tally;

    if (endpoints.empty()) {
        Debug::log(ERR, "CValidationRacer: no endpoints to ask");
        NResultPolicy::conclude(tally, result);
        return result;
    }

    std::vector<std::string> urls;
    for (const auto& e : endpoints) {
        urls.emplace_back(NRequestUtils::composeUrl(opts.https, e, request.query()));

        if (!result.lastQuery.empty())
            result.lastQuery += " ";
        result.lastQuery += urls.back();
    }

    auto                                     state = std::make_shared<SRaceState>();
    std::vector<std::shared_ptr<IFetchTask>> tasks;
    std::vector<bool>                        done(urls.size(), false);

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (opts.timeoutSeconds.has_value() && *opts.timeoutSeconds > 0)
        deadline = std::chrono::steady_clock::now() + std::chrono::seconds(*opts.timeoutSeconds) + std::chrono::seconds(RACE_DEADLINE_GRACE_S);

    // fan out before waiting on anything
    for (size_t i = 0; i < urls.size(); ++i) {
        Debug::log(TRACE, "CValidationRacer: dispatching {}", urls[i]);

        tasks.emplace_back(m_fetcher.fetch(SFetchRequest{.url = urls[i], .verifyTls = opts.verifyTls, .timeoutSeconds = opts.timeoutSeconds}, [state, i](SFetchResult r) {
            std::lock_guard<std::mutex> lg(state->mtx);
            if (state->concluded)
                return;
            state->results.emplace_back(i, std::move(r));
            state->cv.notify_one();
        }));
    }

    size_t      pending = urls.size();
    bool        decided = false;
    std::string fallbackBody;

    while (pending > 0 && !decided) {
        std::pair<size_t, SFetchResult> next;

        {
            std::unique_lock<std::mutex> ul(state->mtx);
            const auto                   READY = [&state]() { return !state->results.empty(); };

            if (deadline.has_value()) {
                if (!state->cv.wait_until(ul, *deadline, READY)) {
                    Debug::log(WARN, "CValidationRacer: {} endpoint(s) did not answer in time", pending);
                    for (size_t i = 0; i < pending; ++i) {
                        tally.addFailure();
                    }
                    break;
                }
            } else
                state->cv.wait(ul, READY);

            next = std::move(state->results.front());
            state->results.pop_front();
        }

        auto& [idx, fetched] = next;
        done[idx]            = true;
        pending--;

        if (!fetched.ok) {
            Debug::log(WARN, "CValidationRacer: {} failed: {}", fetched.url, fetched.error);
            tally.addFailure();
            continue;
        }

        if (opts.waitForAll)
            result.lastResponse += fmt::format("URL={}\n{}\n", fetched.url, fetched.body);

        const CValidationResponse RESPONSE(fetched.body, request.otp(), request.nonce(), m_crypto);
        tally.add(RESPONSE);

        Debug::log(TRACE, "CValidationRacer: {} answered {} ({})", fetched.url, RESPONSE.status(), responseKindToString(RESPONSE.kind()));

        if (RESPONSE.kind() == RESPONSE_OTHER_STATUS && fallbackBody.empty())
            fallbackBody = fetched.body;

        if (RESPONSE.decisive() && !opts.waitForAll) {
            result.lastResponse = fetched.body;
            decided             = true;
        }
    }

    {
        std::lock_guard<std::mutex> lg(state->mtx);
        state->concluded = true;
    }

    // abandon whatever is still in flight, without waiting for it
    for (size_t i = 0; i < tasks.size(); ++i) {
        if (!done[i] && tasks[i]) {
            Debug::log(TRACE, "CValidationRacer: cancelling {}", urls[i]);
            tasks[i]->cancel();
        }
    }
    tasks.clear();

    NResultPolicy::conclude(tally, result);

    if (!opts.waitForAll && result.lastResponse.empty())
        result.lastResponse = fallbackBody;

    return result;
}
