#pragma once
#include <string>
#include <optional>

namespace BioVerify {
    // Pulls the profile bio out of a profile page. Tries, in order: the
    // ld+json structured data block, <meta name="description">, the
    // SIGI_STATE client state blob and the data-e2e="user-bio" element.
    // Never throws; a page with none of them yields std::nullopt.
    class BioExtractor {
    public:
        static std::optional<std::string> ExtractBio(const std::string& html_content);
    };
}
