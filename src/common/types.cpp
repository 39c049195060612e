#include "livebar/common/types.hpp"

namespace livebar {
namespace common {

std::string to_string(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::ANIMATED: return "ANIMATED";
        case DisplayMode::FALLBACK: return "FALLBACK";
        default: return "UNKNOWN";
    }
}

std::string to_string(RedrawReason reason) {
    switch (reason) {
        case RedrawReason::START: return "START";
        case RedrawReason::UPDATE: return "UPDATE";
        case RedrawReason::SUFFIX: return "SUFFIX";
        case RedrawReason::REFRESH: return "REFRESH";
        case RedrawReason::FINALIZE: return "FINALIZE";
        default: return "UNKNOWN";
    }
}

}}
