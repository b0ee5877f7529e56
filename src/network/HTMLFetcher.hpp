#pragma once
#include <string>
#include "../interfaces/IHTMLFetcher.hpp"

namespace BioVerify {

// libcurl-backed transport. Each Fetch() owns its own easy handle, so one
// instance can serve concurrent callers. curl_global_init() must have been
// called before the first fetch.
class HTMLFetcher : public IHTMLFetcher {
public:
    HTMLFetcher() = default;

    // Non-copyable
    HTMLFetcher(const HTMLFetcher&) = delete;
    HTMLFetcher& operator=(const HTMLFetcher&) = delete;

    FetchResult Fetch(const std::string& url, const HeaderList& headers) override;
};

// Reason phrase of a status line ("HTTP/1.1 404 Not Found\r\n" -> "Not Found").
// Empty for HTTP/2 lines, which carry none, and for non-status header lines.
std::string ReasonPhraseFromStatusLine(const std::string& line);

// Standard reason phrase for an HTTP status code, empty if unknown.
std::string DefaultReasonPhrase(long status_code);

}
