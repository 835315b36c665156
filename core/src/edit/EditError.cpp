#include "tu/edit/EditError.hpp"

namespace tu {

const char* errorCodeName(EditErrorCode code) {
  switch (code) {
    case EditErrorCode::None:           return "OK";
    case EditErrorCode::Range:          return "RANGE_ERROR";
    case EditErrorCode::StaleEdit:      return "STALE_EDIT";
    case EditErrorCode::EmptyHistory:   return "EMPTY_HISTORY";
    case EditErrorCode::EmptyFuture:    return "EMPTY_FUTURE";
    case EditErrorCode::BadCommand:     return "BAD_COMMAND";
    case EditErrorCode::UnknownCommand: return "UNKNOWN_COMMAND";
  }
  return "UNKNOWN";
}

EditResult editFail(EditErrorCode code,
                    const std::string& message,
                    const std::string& detailsJson) {
  EditResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

} // namespace tu
