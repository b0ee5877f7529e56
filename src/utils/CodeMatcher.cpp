#include "CodeMatcher.hpp"
#include <algorithm>

namespace BioVerify {
namespace CodeMatcher {

static inline char FoldAscii(unsigned char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
}

bool Matches(const std::string& bio, const std::string& code) {
    auto it = std::search(bio.begin(), bio.end(), code.begin(), code.end(),
        [](char a, char b) { return FoldAscii(a) == FoldAscii(b); });
    return it != bio.end() || code.empty();
}

}
}
