#pragma once
#include "tu/edit/EditError.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace tu {

class TextBuffer;

// Shared bounds check for Edit::make and Buffer::applyRange.
// Fills `err` (code Range) and returns false when the range is invalid.
bool validateRange(std::size_t length, std::int64_t from, std::int64_t to,
                   EditError& err);

// A single range replacement: text[from, to) becomes `replacement`.
// Offsets are only meaningful against the exact text the Edit was built
// from; `removed` is that text's [from, to) slice, captured at construction.
class Edit {
public:
  Edit() = default;

  // Validates 0 <= from <= to <= text.size(). On failure fills `err`
  // (code Range) and leaves `out` untouched.
  static bool make(const std::string& text,
                   const std::string& replacement,
                   std::int64_t from, std::int64_t to,
                   Edit& out, EditError& err);

  const std::string& replacement() const { return replacement_; }
  const std::string& removed() const { return removed_; }
  std::size_t from() const { return from_; }
  std::size_t to() const { return to_; }

  // length(replacement) - (to - from)
  std::int64_t netChange() const;

  // The Edit that undoes this one when applied right after it.
  Edit reversed() const;

  // True when `text` still holds `removed` at [from, to).
  bool canApplyTo(const std::string& text) const;

  // Splices into `buffer`. Fails with StaleEdit (buffer untouched) when
  // canApplyTo() does not hold.
  EditResult apply(TextBuffer& buffer) const;

  bool operator==(const Edit& o) const;
  bool operator!=(const Edit& o) const { return !(*this == o); }

private:
  Edit(std::string replacement, std::string removed,
       std::size_t from, std::size_t to);

  std::string replacement_;
  std::string removed_;
  std::size_t from_{0};
  std::size_t to_{0};
};

} // namespace tu
