#pragma once
#include <string>

namespace BioVerify {
namespace CodeMatcher {

// Case-insensitive (ASCII) substring test. No other normalization.
bool Matches(const std::string& bio, const std::string& code);

}
}
