#include <catch2/catch_all.hpp>
#include "utils/CodeMatcher.hpp"
#include "utils/ProfileUtil.hpp"
#include "utils/ResponseBuilder.hpp"

using namespace BioVerify;

TEST_CASE("NormalizeUsername drops the sigil and trims") {
    using ProfileUtil::NormalizeUsername;

    CHECK(NormalizeUsername("@Example.User ") == "Example.User");
    CHECK(NormalizeUsername("  plain_name\t") == "plain_name");
    CHECK(NormalizeUsername(" @spaced") == "spaced");
    CHECK(NormalizeUsername("@") == "");
}

TEST_CASE("MakeRequest rejects empty fields after normalization") {
    using ProfileUtil::MakeRequest;

    auto ok = MakeRequest("@Example.User ", "abc123");
    REQUIRE(ok.has_value());
    CHECK(ok->username == "Example.User");
    CHECK(ok->code == "abc123");

    CHECK_FALSE(MakeRequest("@ ", "abc123").has_value());
    CHECK_FALSE(MakeRequest("user", "").has_value());
    CHECK_FALSE(MakeRequest("", "").has_value());
}

TEST_CASE("BuildProfileUrl joins base and handle") {
    using ProfileUtil::BuildProfileUrl;

    CHECK(BuildProfileUrl("https://www.tiktok.com", "example.user") == "https://www.tiktok.com/@example.user");
    CHECK(BuildProfileUrl("https://www.tiktok.com/", "a_b") == "https://www.tiktok.com/@a_b");
    CHECK(BuildProfileUrl("http://127.0.0.1:8080", "we/ird?x") == "http://127.0.0.1:8080/@we%2Fird%3Fx");
}

TEST_CASE("FormatIsoTimestamp renders UTC with milliseconds") {
    std::chrono::system_clock::time_point tp{std::chrono::milliseconds(1714566896789LL)};
    CHECK(ProfileUtil::FormatIsoTimestamp(tp) == "2024-05-01T12:34:56.789Z");

    std::chrono::system_clock::time_point epoch{};
    CHECK(ProfileUtil::FormatIsoTimestamp(epoch) == "1970-01-01T00:00:00.000Z");
}

TEST_CASE("CodeMatcher is a case-insensitive substring test") {
    using CodeMatcher::Matches;

    CHECK(Matches("Verify: ABC123 #brand", "abc123"));
    CHECK(Matches("verify: abc123", "ABC123"));
    CHECK(Matches("xAbC123y", "aBc123"));
    CHECK_FALSE(Matches("Verify: ABC12 3", "abc123"));
    CHECK_FALSE(Matches("", "abc"));
    CHECK_FALSE(Matches("ab", "abc"));
    CHECK(Matches("anything", ""));
    CHECK(Matches("", ""));
}

TEST_CASE("CodeMatcher does not normalize whitespace") {
    CHECK_FALSE(CodeMatcher::Matches("code: A B C", "abc"));
    CHECK_FALSE(CodeMatcher::Matches("code:abc", "abc "));
}

TEST_CASE("Response bodies carry the expected fields") {
    VerificationResult result{true, "Example.User", "abc123", "2024-05-01T12:34:56.789Z"};
    auto ok = BuildSuccessBody(result);
    CHECK(ok["success"] == true);
    CHECK(ok["found"] == true);
    CHECK(ok["username"] == "Example.User");
    CHECK(ok["code"] == "abc123");
    CHECK(ok["timestamp"] == "2024-05-01T12:34:56.789Z");

    auto bad = BuildBadRequestBody();
    CHECK(bad["success"] == false);
    CHECK(bad["error"] == "Username and code required");

    auto err = BuildErrorBody("blocked", "request blocked (403 Forbidden)");
    CHECK(err["success"] == false);
    CHECK(err["error"] == "Internal server error");
    CHECK(err["category"] == "blocked");
    CHECK(err["message"] == "request blocked (403 Forbidden)");
}
