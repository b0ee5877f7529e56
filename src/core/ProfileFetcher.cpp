#include "ProfileFetcher.hpp"
#include "../network/FetchErrors.hpp"
#include "../parser/BioExtractor.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ProfileUtil.hpp"
#include "../../config/Config.hpp"

namespace BioVerify {

ProfileFetcher::ProfileFetcher(IHTMLFetcher& transport)
    : transport_(transport) {}

HeaderList ProfileFetcher::BrowserHeaders(const std::string& user_agent) {
    return {
        {"User-Agent", user_agent},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,image/apng,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.9"},
        {"Accept-Encoding", "gzip, deflate, br"},
        {"Connection", "keep-alive"},
        {"Upgrade-Insecure-Requests", "1"},
        {"Sec-Fetch-Dest", "document"},
        {"Sec-Fetch-Mode", "navigate"},
        {"Sec-Fetch-Site", "none"},
        {"Cache-Control", "max-age=0"},
        {"DNT", "1"},
    };
}

std::optional<std::string> ProfileFetcher::FetchBio(const std::string& username) {
    const auto& config = Config::GetInstance();
    const std::string url = ProfileUtil::BuildProfileUrl(config.profile_base_url, username);

    FetchResult result = transport_.Fetch(url, BrowserHeaders(config.http_user_agent));

    if (!result.error.empty()) {
        throw NetworkError(result.error);
    }

    Logger::Log(LogLevel::Info, "Response status: " + std::to_string(result.status_code));
    if (result.status_code == 404) {
        throw NotFoundError(username);
    }
    if (result.status_code == 403) {
        throw BlockedError();
    }
    if (result.status_code < 200 || result.status_code >= 300) {
        throw HttpStatusError(result.status_code, result.status_text);
    }

    Logger::Log(LogLevel::Debug, "HTML length: " + std::to_string(result.content.size()) + " characters");
    return BioExtractor::ExtractBio(result.content);
}

}
