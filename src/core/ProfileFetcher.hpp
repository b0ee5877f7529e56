#pragma once
#include "../interfaces/IHTMLFetcher.hpp"
#include "../interfaces/IProfileFetcher.hpp"

namespace BioVerify {
    // One GET of the profile page per call, classified and handed to BioExtractor.
    class ProfileFetcher : public IProfileFetcher {
    public:
        explicit ProfileFetcher(IHTMLFetcher& transport);

        std::optional<std::string> FetchBio(const std::string& username) override;

        // Header set of an ordinary desktop browser navigation.
        static HeaderList BrowserHeaders(const std::string& user_agent);

    private:
        IHTMLFetcher& transport_;
    };
}
