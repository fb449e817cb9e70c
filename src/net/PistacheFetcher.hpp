#pragma once

#include "Fetcher.hpp"

#include <cstddef>

class CPistacheFetcher : public IFetcher {
  public:
    CPistacheFetcher(size_t maxResponseSize = 64 * 1024);

    std::shared_ptr<IFetchTask> fetch(const SFetchRequest& request, std::function<void(SFetchResult)> onDone) override;

  private:
    size_t m_maxResponseSize = 0;
};
