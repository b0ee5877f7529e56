#include "FetchErrors.hpp"

namespace BioVerify {

const char* ToString(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::NotFound:   return "not_found";
        case FetchErrorKind::Blocked:    return "blocked";
        case FetchErrorKind::HttpStatus: return "http_status";
        case FetchErrorKind::Network:    return "network";
    }
    return "internal";
}

std::string ErrorCategory(const std::exception& e) {
    if (const auto* fetch_error = dynamic_cast<const FetchError*>(&e)) {
        return ToString(fetch_error->Kind());
    }
    return "internal";
}

}
