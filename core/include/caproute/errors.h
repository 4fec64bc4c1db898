#pragma once

#include <stdexcept>
#include <string>

namespace caproute {

// Error taxonomy shared by the API layer, the audit log and the tests.
enum class ErrorKind {
    CATALOG_UNAVAILABLE,
    NO_ELIGIBLE_CANDIDATE,
    TIE_BREAK_FAILED,
    SERVICE_UNAVAILABLE,
    STEP_EXECUTION_ERROR,
    INVALID_REQUEST,
};

const char* error_kind_str(ErrorKind k);

// Durable store unreachable (or no store slot available in time).
class CatalogUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Tool definition rejected at import: schema, range or monotonicity violation.
class CatalogAuthoringError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A published name@version was re-imported with different content.
class CatalogConflict : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A step could not be stamped from the selection it claims to come from.
class EnrichmentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace caproute
