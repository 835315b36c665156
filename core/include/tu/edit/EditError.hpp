#pragma once
#include <cstdint>
#include <string>

namespace tu {

enum class EditErrorCode : std::uint8_t {
  None = 0,
  Range,          // from/to outside [0, length] or from > to
  StaleEdit,      // history entry no longer matches the buffer
  EmptyHistory,   // undo with nothing to undo
  EmptyFuture,    // redo with nothing to redo
  BadCommand,     // malformed JSON command
  UnknownCommand
};

struct EditError {
  EditErrorCode code{EditErrorCode::None};
  std::string message;  // human text
  std::string details;  // small JSON string with the offending fields
};

struct EditResult {
  bool ok{true};
  EditError err{};
  std::string text;     // buffer text after the operation (empty on failure)
};

// Stable string for an error code, e.g. "RANGE_ERROR".
const char* errorCodeName(EditErrorCode code);

EditResult editFail(EditErrorCode code,
                    const std::string& message,
                    const std::string& detailsJson = "{}");

} // namespace tu
