#include "nmsync/core/errors.hpp"

#include <notmuch.h>

namespace nmsync::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::Io: return "Io";
        case StatusCode::Unavailable: return "Unavailable";
        case StatusCode::Engine: return "Engine";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Engine: return "Engine";
        case StatusDomain::Bindings: return "Bindings";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::Config: return "Config";
    }
    return "Unknown";
}

const char* status_message(Status s) noexcept {
    if (is_engine_error(s)) {
        const char* msg = notmuch_status_to_string(static_cast<notmuch_status_t>(s.aux));
        return msg ? msg : "unknown engine status";
    }
    return status_code_name(s.code);
}

} // namespace nmsync::core
