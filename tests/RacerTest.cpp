#include <gtest/gtest.h>

#include "core/Crypto.hpp"
#include "core/Racer.hpp"
#include "core/Request.hpp"
#include "FakeFetcher.hpp"

#include <chrono>
#include <climits>

using namespace std::chrono_literals;

static const std::vector<std::string> ENDPOINTS = {"one.example.com/verify", "two.example.com/verify", "three.example.com/verify"};

static CFakeFetcher::SScript answer(const std::string& status, std::chrono::milliseconds delay, const std::string& key = TEST_KEY_RAW) {
    return {.mode = CFakeFetcher::FAKE_DELAYED, .delay = delay, .body = [status, key](const std::string& url) { return fakeServerBody(url, status, key); }};
}

static CFakeFetcher::SScript hang() {
    return {.mode = CFakeFetcher::FAKE_HANG, .delay = 0ms, .body = nullptr};
}

static CFakeFetcher::SScript fail(std::chrono::milliseconds delay) {
    return {.mode = CFakeFetcher::FAKE_FAIL, .delay = delay, .body = nullptr};
}

class RacerTest : public ::testing::Test {
  protected:
    CCrypto            m_crypto{TEST_KEY_RAW};
    CFakeFetcher       m_fetcher;
    CValidationRequest m_request{"42", TEST_OTP, m_crypto};
    CValidationRacer   m_racer{m_fetcher, m_crypto};
};

TEST_F(RacerTest, FirstOkWinsAndCancelsTheRest) {
    m_fetcher.script("one.example.com", answer("OK", 10ms));
    m_fetcher.script("two.example.com", hang());
    m_fetcher.script("three.example.com", hang());

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {});
    m_fetcher.joinAll();

    EXPECT_EQ(RESULT.verdict, VERDICT_VALID);
    EXPECT_TRUE(RESULT.lastResponse.contains("status=OK"));
    EXPECT_TRUE(RESULT.lastResponse.contains("nonce=" + m_request.nonce()));
    EXPECT_EQ(m_fetcher.cancellations(), 2u);
    EXPECT_EQ(m_fetcher.completions(), 1u);
}

TEST_F(RacerTest, InlineAnswer) {
    m_fetcher.script("one.example.com",
                     {.mode = CFakeFetcher::FAKE_INLINE, .delay = 0ms, .body = [](const std::string& url) { return fakeServerBody(url, "OK", TEST_KEY_RAW); }});
    m_fetcher.script("two.example.com", hang());
    m_fetcher.script("three.example.com", hang());

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {});
    m_fetcher.joinAll();

    EXPECT_EQ(RESULT.verdict, VERDICT_VALID);
    EXPECT_EQ(m_fetcher.cancellations(), 2u);
}

TEST_F(RacerTest, TransportFailureDoesNotAbortTheRace) {
    m_fetcher.script("one.example.com", fail(1ms));
    m_fetcher.script("two.example.com", answer("OK", 40ms));
    m_fetcher.script("three.example.com", hang());

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {});
    m_fetcher.joinAll();

    EXPECT_EQ(RESULT.verdict, VERDICT_VALID);
    EXPECT_EQ(RESULT.transportFailures, 1u);
    EXPECT_EQ(m_fetcher.cancellations(), 1u);
}

TEST_F(RacerTest, FirstDecisiveReplayWins) {
    m_fetcher.script("one.example.com", answer("REPLAYED_OTP", 1ms));
    m_fetcher.script("two.example.com", answer("OK", 300ms));
    m_fetcher.script("three.example.com", hang());

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {});
    m_fetcher.joinAll();

    EXPECT_EQ(RESULT.verdict, VERDICT_REPLAYED);
    EXPECT_TRUE(RESULT.lastResponse.contains("status=REPLAYED_OTP"));
    EXPECT_EQ(m_fetcher.cancellations(), 2u);
}

TEST_F(RacerTest, BadSignatureKeepsRacing) {
    m_fetcher.script("one.example.com", answer("OK", 1ms, "forged key"));
    m_fetcher.script("two.example.com", answer("OK", 40ms));
    m_fetcher.script("three.example.com", hang());

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {});
    m_fetcher.joinAll();

    EXPECT_EQ(RESULT.verdict, VERDICT_VALID);
    EXPECT_EQ(RESULT.bodies, 2u);
    EXPECT_EQ(RESULT.lastResponse, fakeServerBody(m_fetcher.requests()[1].url, "OK", TEST_KEY_RAW));
}

TEST_F(RacerTest, ServerErrorEverywhere) {
    for (const auto& ep : ENDPOINTS) {
        m_fetcher.script(ep, answer("NO_SUCH_CLIENT", 5ms));
    }

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {});

    EXPECT_EQ(RESULT.verdict, VERDICT_SERVER_ERROR);
    EXPECT_EQ(RESULT.status, "NO_SUCH_CLIENT");
    EXPECT_EQ(verdictToString(RESULT), "NO_SUCH_CLIENT");
    EXPECT_EQ(RESULT.bodies, 3u);
    EXPECT_TRUE(RESULT.lastResponse.contains("status=NO_SUCH_CLIENT"));
    EXPECT_EQ(m_fetcher.cancellations(), 0u);
}

TEST_F(RacerTest, UnpairedServerErrorIsNoDecisiveAnswer) {
    // real servers do not echo otp and nonce when they reject the client
    for (const auto& ep : ENDPOINTS) {
        m_fetcher.script(ep, {.mode = CFakeFetcher::FAKE_DELAYED, .delay = 5ms, .body = [](const std::string&) {
                                  return std::string("h=bm90IGEgc2lnbmF0dXJl\r\nt=2026-10-18T12:00:00Z0123\r\nstatus=NO_SUCH_CLIENT\r\n\r\n");
                              }});
    }

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {});

    EXPECT_EQ(RESULT.verdict, VERDICT_NO_DECISIVE_ANSWER);
    EXPECT_EQ(RESULT.status, "NO_SUCH_CLIENT");
    EXPECT_EQ(verdictToString(RESULT), "NO_VALID_ANSWER");
}

TEST_F(RacerTest, AllTransportsFail) {
    for (const auto& ep : ENDPOINTS) {
        m_fetcher.script(ep, fail(1ms));
    }

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {});

    EXPECT_EQ(RESULT.verdict, VERDICT_TRANSPORT_FAILURE);
    EXPECT_EQ(RESULT.transportFailures, 3u);
    EXPECT_EQ(RESULT.lastResponse, "");
}

TEST_F(RacerTest, WaitForAllCollectsEveryBody) {
    m_fetcher.script("one.example.com", answer("OK", 1ms));
    m_fetcher.script("two.example.com", answer("REPLAYED_OTP", 20ms));
    m_fetcher.script("three.example.com", answer("BAD_OTP", 40ms));

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {.waitForAll = true});

    EXPECT_EQ(RESULT.verdict, VERDICT_REPLAYED);
    EXPECT_EQ(RESULT.bodies, 3u);
    EXPECT_EQ(m_fetcher.cancellations(), 0u);

    for (const auto& r : m_fetcher.requests()) {
        EXPECT_TRUE(RESULT.lastResponse.contains("URL=" + r.url + "\n")) << r.url;
    }
    EXPECT_TRUE(RESULT.lastResponse.contains("status=OK"));
    EXPECT_TRUE(RESULT.lastResponse.contains("status=REPLAYED_OTP"));
    EXPECT_TRUE(RESULT.lastResponse.contains("status=BAD_OTP"));
}

TEST_F(RacerTest, WaitForAllStillPrefersDecisive) {
    m_fetcher.script("one.example.com", answer("BACKEND_ERROR", 1ms));
    m_fetcher.script("two.example.com", answer("OK", 20ms));
    m_fetcher.script("three.example.com", fail(30ms));

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {.waitForAll = true});

    EXPECT_EQ(RESULT.verdict, VERDICT_VALID);
    EXPECT_EQ(RESULT.transportFailures, 1u);
    EXPECT_TRUE(RESULT.lastResponse.contains("URL=http://one.example.com/verify?"));
    EXPECT_TRUE(RESULT.lastResponse.contains("URL=http://two.example.com/verify?"));
    EXPECT_FALSE(RESULT.lastResponse.contains("URL=http://three.example.com/verify?"));
}

TEST_F(RacerTest, QueriesAndFetchOptions) {
    for (const auto& ep : ENDPOINTS) {
        m_fetcher.script(ep, answer("OK", 1ms));
    }

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {.https = true, .verifyTls = false, .waitForAll = true, .timeoutSeconds = 7});

    const auto REQUESTS = m_fetcher.requests();
    ASSERT_EQ(REQUESTS.size(), 3u);

    std::string expectedQuery;
    for (const auto& ep : ENDPOINTS) {
        if (!expectedQuery.empty())
            expectedQuery += " ";
        expectedQuery += "https://" + ep + "?" + m_request.query();
    }
    EXPECT_EQ(RESULT.lastQuery, expectedQuery);

    for (const auto& r : REQUESTS) {
        EXPECT_TRUE(r.url.starts_with("https://"));
        EXPECT_TRUE(r.url.ends_with("?" + m_request.query()));
        EXPECT_FALSE(r.verifyTls);
        EXPECT_EQ(r.timeoutSeconds.value_or(0), 7);
    }
}

TEST_F(RacerTest, DeadlineEndsAHungRace) {
    for (const auto& ep : ENDPOINTS) {
        m_fetcher.script(ep, hang());
    }

    const auto START  = std::chrono::steady_clock::now();
    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {.timeoutSeconds = 1});
    m_fetcher.joinAll();

    EXPECT_EQ(RESULT.verdict, VERDICT_TRANSPORT_FAILURE);
    EXPECT_EQ(RESULT.transportFailures, 3u);
    EXPECT_EQ(m_fetcher.cancellations(), 3u);
    EXPECT_LT(std::chrono::steady_clock::now() - START, 10s);
}

TEST_F(RacerTest, LargestTimeoutStillTakesTheAnswer) {
    m_fetcher.script("one.example.com", answer("OK", 10ms));
    m_fetcher.script("two.example.com", hang());
    m_fetcher.script("three.example.com", hang());

    const auto RESULT = m_racer.race(m_request, ENDPOINTS, {.timeoutSeconds = INT_MAX});
    m_fetcher.joinAll();

    EXPECT_EQ(RESULT.verdict, VERDICT_VALID);
    EXPECT_EQ(RESULT.transportFailures, 0u);
    EXPECT_EQ(m_fetcher.cancellations(), 2u);
}

TEST_F(RacerTest, NoEndpoints) {
    const auto RESULT = m_racer.race(m_request, {}, {});
    EXPECT_EQ(RESULT.verdict, VERDICT_TRANSPORT_FAILURE);
    EXPECT_EQ(RESULT.lastQuery, "");
}
