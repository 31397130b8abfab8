#include "errors.hpp"

namespace ledger {

std::string toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::VALIDATION: return "validation_error";
    case ErrorKind::NOT_FOUND: return "not_found";
    case ErrorKind::UNAUTHORIZED: return "unauthorized_access";
    case ErrorKind::CONFLICT: return "conflict";
    case ErrorKind::SYSTEMIC: return "systemic_error";
  }
  return "unknown";
}

}  // namespace ledger
