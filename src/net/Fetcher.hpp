#pragma once

#include <string>
#include <memory>
#include <optional>
#include <functional>

struct SFetchRequest {
    std::string        url;
    bool               verifyTls = true;
    std::optional<int> timeoutSeconds;
};

struct SFetchResult {
    std::string url;
    bool        ok = false;
    std::string body;
    std::string error;
};

class IFetchTask {
  public:
    virtual ~IFetchTask() = default;

    // after cancel() returns, the completion callback will not run anymore
    virtual void cancel() = 0;
};

// GETs a URL and reports the body or a transport error. fetch() may be called
// concurrently, onDone may run on any thread (or inline, before fetch() returns).
class IFetcher {
  public:
    virtual ~IFetcher() = default;

    virtual std::shared_ptr<IFetchTask> fetch(const SFetchRequest& request, std::function<void(SFetchResult)> onDone) = 0;
};
