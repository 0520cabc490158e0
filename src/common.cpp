#include "common.hpp"

// ─────────────────────────────────────
const char *ErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::Conflict:
        return "conflict";
    case ErrorKind::Storage:
        return "storage";
    }
    return "unknown";
}
