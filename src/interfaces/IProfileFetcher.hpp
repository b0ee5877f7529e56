#pragma once
#include <string>
#include <optional>

namespace BioVerify {

class IProfileFetcher {
public:
    virtual ~IProfileFetcher() = default;
    // Returns the profile bio, or std::nullopt when the page carried none.
    // Throws a FetchError subclass when the page could not be retrieved.
    virtual std::optional<std::string> FetchBio(const std::string& username) = 0;
};

}
