#pragma once
#include "tu/edit/EditError.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace tu {

// Mutable text storage. Knows nothing about undo or redo.
class TextBuffer {
public:
  virtual ~TextBuffer() = default;
  virtual const std::string& text() const = 0;
  virtual std::size_t length() const = 0;

  // Replaces text[from, to) with `replacement` and returns the new text.
  // Fails with Range (text untouched) unless 0 <= from <= to <= length().
  virtual EditResult applyRange(const std::string& replacement,
                                std::int64_t from, std::int64_t to) = 0;
};

} // namespace tu
