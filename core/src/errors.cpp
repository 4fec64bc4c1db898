#include "caproute/errors.h"

namespace caproute {

const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::CATALOG_UNAVAILABLE: return "catalog_unavailable";
        case ErrorKind::NO_ELIGIBLE_CANDIDATE: return "no_eligible_candidate";
        case ErrorKind::TIE_BREAK_FAILED: return "tie_break_failed";
        case ErrorKind::SERVICE_UNAVAILABLE: return "service_unavailable";
        case ErrorKind::STEP_EXECUTION_ERROR: return "step_execution_error";
        case ErrorKind::INVALID_REQUEST: return "invalid_request";
    }
    return "unknown";
}

} // namespace caproute
