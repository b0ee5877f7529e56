#include <catch2/catch_all.hpp>
#include <algorithm>
#include "core/ProfileFetcher.hpp"
#include "network/FetchErrors.hpp"
#include "network/HTMLFetcher.hpp"

using namespace BioVerify;

namespace {

class FakeTransport : public IHTMLFetcher {
public:
    explicit FakeTransport(FetchResult result) : result_(std::move(result)) {}

    FetchResult Fetch(const std::string& url, const HeaderList& headers) override {
        ++calls;
        last_url = url;
        last_headers = headers;
        return result_;
    }

    int calls = 0;
    std::string last_url;
    HeaderList last_headers;

private:
    FetchResult result_;
};

FetchResult Status(long code, const std::string& text = "", const std::string& body = "") {
    FetchResult r;
    r.status_code = code;
    r.status_text = text;
    r.content = body;
    return r;
}

bool HasHeader(const HeaderList& headers, const std::string& name, const std::string& value) {
    return std::any_of(headers.begin(), headers.end(), [&](const auto& h) {
        return h.first == name && h.second == value;
    });
}

}

TEST_CASE("ProfileFetcher requests the canonical profile URL once with browser headers") {
    FakeTransport transport(Status(200, "OK", "<html></html>"));
    ProfileFetcher fetcher(transport);

    fetcher.FetchBio("Example.User");

    CHECK(transport.calls == 1);
    CHECK(transport.last_url == "https://www.tiktok.com/@Example.User");
    CHECK(transport.last_headers.size() == 11);
    CHECK(HasHeader(transport.last_headers, "Accept-Language", "en-US,en;q=0.9"));
    CHECK(HasHeader(transport.last_headers, "Accept-Encoding", "gzip, deflate, br"));
    CHECK(HasHeader(transport.last_headers, "Sec-Fetch-Mode", "navigate"));
    CHECK(HasHeader(transport.last_headers, "Cache-Control", "max-age=0"));
    CHECK(HasHeader(transport.last_headers, "DNT", "1"));
}

TEST_CASE("ProfileFetcher returns the extracted bio on success") {
    FakeTransport transport(Status(200, "OK",
        R"html(<html><head><meta name="description" content="Verify: ABC123 #brand"></head></html>)html"));
    ProfileFetcher fetcher(transport);

    auto bio = fetcher.FetchBio("someone");
    REQUIRE(bio.has_value());
    CHECK(*bio == "Verify: ABC123 #brand");
}

TEST_CASE("ProfileFetcher passes through pages without a bio") {
    FakeTransport transport(Status(200, "OK", "<html><body>challenge</body></html>"));
    ProfileFetcher fetcher(transport);
    CHECK_FALSE(fetcher.FetchBio("someone").has_value());
}

TEST_CASE("ProfileFetcher classifies HTTP failures") {
    SECTION("404 is NotFoundError") {
        FakeTransport transport(Status(404, "Not Found"));
        ProfileFetcher fetcher(transport);
        REQUIRE_THROWS_AS(fetcher.FetchBio("ghost"), NotFoundError);
        try {
            fetcher.FetchBio("ghost");
        } catch (const FetchError& e) {
            CHECK(e.Kind() == FetchErrorKind::NotFound);
            CHECK(std::string(e.what()) == "user @ghost not found");
        }
    }
    SECTION("403 is BlockedError") {
        FakeTransport transport(Status(403, "Forbidden"));
        ProfileFetcher fetcher(transport);
        REQUIRE_THROWS_AS(fetcher.FetchBio("someone"), BlockedError);
    }
    SECTION("other statuses are HttpStatusError") {
        FakeTransport transport(Status(503, "Service Unavailable"));
        ProfileFetcher fetcher(transport);
        try {
            fetcher.FetchBio("someone");
            FAIL("expected HttpStatusError");
        } catch (const HttpStatusError& e) {
            CHECK(e.Status() == 503);
            CHECK(e.StatusText() == "Service Unavailable");
            CHECK(std::string(e.what()) == "HTTP 503: Service Unavailable");
        }
    }
}

TEST_CASE("ProfileFetcher maps transport failures to NetworkError") {
    FetchResult failed;
    failed.error = "Could not resolve host: www.tiktok.com";
    FakeTransport transport(failed);
    ProfileFetcher fetcher(transport);

    try {
        fetcher.FetchBio("someone");
        FAIL("expected NetworkError");
    } catch (const NetworkError& e) {
        CHECK(e.Cause() == "Could not resolve host: www.tiktok.com");
        CHECK(ErrorCategory(e) == "network");
    }
}

TEST_CASE("ErrorCategory names every failure kind") {
    CHECK(ErrorCategory(NotFoundError("x")) == "not_found");
    CHECK(ErrorCategory(BlockedError()) == "blocked");
    CHECK(ErrorCategory(HttpStatusError(500, "Internal Server Error")) == "http_status");
    CHECK(ErrorCategory(NetworkError("timeout")) == "network");
    CHECK(ErrorCategory(std::runtime_error("boom")) == "internal");
}

TEST_CASE("DefaultReasonPhrase covers common statuses") {
    CHECK(DefaultReasonPhrase(404) == "Not Found");
    CHECK(DefaultReasonPhrase(429) == "Too Many Requests");
    CHECK(DefaultReasonPhrase(599).empty());
}

TEST_CASE("ReasonPhraseFromStatusLine reads the phrase after the status code") {
    CHECK(ReasonPhraseFromStatusLine("HTTP/1.1 404 Not Found\r\n") == "Not Found");
    CHECK(ReasonPhraseFromStatusLine("HTTP/1.1 503 Service Unavailable\r\n") == "Service Unavailable");
    CHECK(ReasonPhraseFromStatusLine("HTTP/2 200 \r\n").empty());
    CHECK(ReasonPhraseFromStatusLine("HTTP/1.1 404\r\n").empty());
    CHECK(ReasonPhraseFromStatusLine("Content-Type: text/html\r\n").empty());
}
