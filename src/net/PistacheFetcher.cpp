#include "PistacheFetcher.hpp"

#include "../debug/log.hpp"

#include <atomic>
#include <mutex>

#include <pistache/client.h>
#include <pistache/http.h>
#include <pistache/http_headers.h>

constexpr const char* USER_AGENT = "otpverify";

// Each task owns its client, so cancelling one request tears down exactly that request.
class CPistacheFetchTask : public IFetchTask {
  public:
    ~CPistacheFetchTask() override {
        shutdown();
    }

    void cancel() override {
        cancelled->store(true);
        shutdown();
    }

    void shutdown() {
        std::call_once(shutdownOnce, [this]() {
            if (started)
                client.shutdown();
        });
    }

    Pistache::Http::Experimental::Client                                client;
    std::unique_ptr<Pistache::Async::Promise<Pistache::Http::Response>> response;
    std::shared_ptr<std::atomic<bool>>                                  cancelled = std::make_shared<std::atomic<bool>>(false);
    bool                                                                started   = false;

  private:
    std::once_flag shutdownOnce;
};

static std::string describeException(std::exception_ptr e) {
    try {
        std::rethrow_exception(e);
    } catch (std::exception& e) { return e.what(); } catch (const std::string& e) {
        return e;
    } catch (const char* e) { return e; } catch (...) {
        return "God knows why.";
    }
}

CPistacheFetcher::CPistacheFetcher(size_t maxResponseSize) : m_maxResponseSize(maxResponseSize) {
    ;
}

std::shared_ptr<IFetchTask> CPistacheFetcher::fetch(const SFetchRequest& request, std::function<void(SFetchResult)> onDone) {
    auto task = std::make_shared<CPistacheFetchTask>();

    if (request.url.starts_with("https://")) {
        // the pistache client speaks plain http only
        onDone(SFetchResult{.url = request.url, .ok = false, .body = "", .error = "https is not supported by the pistache transport"});
        return task;
    }

    try {
        task->client.init(Pistache::Http::Experimental::Client::options().threads(1).maxConnectionsPerHost(1).maxResponseSize(m_maxResponseSize));
        task->started = true;

        auto builder = task->client.get(request.url);
        builder.header(std::make_shared<Pistache::Http::Header::UserAgent>(USER_AGENT));
        if (request.timeoutSeconds.has_value() && *request.timeoutSeconds > 0)
            builder.timeout(std::chrono::seconds(*request.timeoutSeconds));

        Debug::log(TRACE, "CPistacheFetcher: GET {}", request.url);

        auto       resp      = builder.send();
        const auto CANCELLED = task->cancelled;
        const auto URL       = request.url;

        resp.then(
            [CANCELLED, URL, onDone](Pistache::Http::Response response) {
                if (CANCELLED->load())
                    return;

                const auto CODE = (int)response.code();
                if (CODE >= 400) {
                    onDone(SFetchResult{.url = URL, .ok = false, .body = "", .error = "HTTP " + std::to_string(CODE)});
                    return;
                }

                onDone(SFetchResult{.url = URL, .ok = true, .body = response.body(), .error = ""});
            },
            [CANCELLED, URL, onDone](std::exception_ptr e) {
                if (CANCELLED->load())
                    return;

                onDone(SFetchResult{.url = URL, .ok = false, .body = "", .error = describeException(e)});
            });

        task->response = std::make_unique<Pistache::Async::Promise<Pistache::Http::Response>>(std::move(resp));
    } catch (std::exception& e) {
        Debug::log(ERR, "CPistacheFetcher: couldn't send a request to {}: {}", request.url, e.what());
        onDone(SFetchResult{.url = request.url, .ok = false, .body = "", .error = e.what()});
    }

    return task;
}
