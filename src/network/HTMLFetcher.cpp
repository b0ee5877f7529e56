#include "HTMLFetcher.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include "../../config/Config.hpp"
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string buffer;
    size_t max_bytes = 0;
    bool truncated = false;
    std::string status_text;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

struct EasyHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    size_t current_size = ctx->buffer.size();
    if (current_size >= ctx->max_bytes) {
        ctx->truncated = true;
        return chunk; // Still need to "receive" it to complete the transfer
    }

    size_t remaining_space = ctx->max_bytes - current_size;
    size_t to_copy = std::min(chunk, remaining_space);

    if (to_copy > 0) {
        try {
            ctx->buffer.append(static_cast<char*>(contents), to_copy);
        } catch (const std::bad_alloc&) {
            return 0; // Indicates an error
        }
    }

    if (to_copy < chunk) {
        ctx->truncated = true;
    }

    return chunk;
}

// Every status line resets the phrase, so after redirects the final response wins.
size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t len = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return len;

    std::string line(buffer, len);
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->status_text = BioVerify::ReasonPhraseFromStatusLine(line);
    }
    return len;
}

bool IsHeader(const std::string& name, const std::string& expected) {
    if (name.size() != expected.size()) return false;
    return std::equal(name.begin(), name.end(), expected.begin(), [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

// Brotli decoding depends on how libcurl was built; fall back to every
// encoding this build can decode so the body is never left compressed.
std::string ResolveAcceptEncoding(const std::string& requested) {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    bool has_brotli = info && (info->features & CURL_VERSION_BROTLI);
    if (!has_brotli && requested.find("br") != std::string::npos) {
        return "";
    }
    return requested;
}

} // anonymous namespace

namespace BioVerify {

FetchResult HTMLFetcher::Fetch(const std::string& url, const HeaderList& headers) {
    FetchResult result;
    const auto& config = Config::GetInstance();

    std::unique_ptr<CURL, EasyHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        result.error = "Failed to initialize cURL easy handle";
        Logger::Log(LogLevel::Error, result.error + " for: " + url);
        return result;
    }

    TransferContext ctx;
    ctx.max_bytes = config.max_html_bytes;

    std::string accept_encoding;
    bool has_accept_encoding = false;
    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : headers) {
        if (IsHeader(name, "Accept-Encoding")) {
            accept_encoding = ResolveAcceptEncoding(value);
            has_accept_encoding = true;
            continue;
        }
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(raw_headers, line.c_str());
        if (!appended) {
            curl_slist_free_all(raw_headers);
            result.error = "Failed to build request headers";
            return result;
        }
        raw_headers = appended;
    }
    // curl copies string options but not this list; it must outlive the transfer.
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_headers);

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, config.http_user_agent.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    if (has_accept_encoding) {
        curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, accept_encoding.c_str());
    }
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, config.http_max_redirects);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, config.http_timeout_ms);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, config.http_connect_timeout_ms);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, ctx.error_buffer);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(handle, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    Logger::Log(LogLevel::Debug, "Fetching: " + url);
    CURLcode code = curl_easy_perform(handle);

    result.content = std::move(ctx.buffer);
    result.truncated = ctx.truncated;

    if (code != CURLE_OK) {
        result.error = ctx.error_buffer;
        if (result.error.empty()) {
            result.error = curl_easy_strerror(code);
        }
        return result;
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &result.status_code);
    char* eff_url = nullptr;
    curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &eff_url);
    if (eff_url) result.effective_url = eff_url;

    result.status_text = ctx.status_text;
    if (result.status_text.empty()) {
        result.status_text = DefaultReasonPhrase(result.status_code);
    }

    if (result.truncated) {
        Logger::Log(LogLevel::Warn, "Response body truncated at " + std::to_string(config.max_html_bytes) + " bytes for: " + url);
    }
    return result;
}

std::string ReasonPhraseFromStatusLine(const std::string& line) {
    if (line.rfind("HTTP/", 0) != 0) return "";

    std::string status_line = line;
    while (!status_line.empty() && (status_line.back() == '\r' || status_line.back() == '\n')) {
        status_line.pop_back();
    }
    auto first_space = status_line.find(' ');
    if (first_space == std::string::npos) return "";
    auto second_space = status_line.find(' ', first_space + 1);
    if (second_space == std::string::npos) return "";

    std::string phrase = status_line.substr(second_space + 1);
    while (!phrase.empty() && phrase.back() == ' ') phrase.pop_back();
    return phrase;
}

std::string DefaultReasonPhrase(long status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 410: return "Gone";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "";
    }
}

}
