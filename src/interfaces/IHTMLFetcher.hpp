#pragma once
#include <string>
#include <utility>
#include <vector>

namespace BioVerify {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct FetchResult {
    std::string content;
    long status_code = 0;
    std::string status_text;
    std::string error; // non-empty on transport failure
    std::string effective_url;
    bool truncated = false;
};

// Performs a single blocking GET. Never throws for transport problems;
// they are reported through FetchResult::error.
class IHTMLFetcher {
public:
    virtual ~IHTMLFetcher() = default;
    virtual FetchResult Fetch(const std::string& url, const HeaderList& headers) = 0;
};

}
