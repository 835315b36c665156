#include "tu/buffer/Buffer.hpp"
#include "tu/edit/Edit.hpp"

#include <utility>

namespace tu {

Buffer::Buffer(std::string initial) : text_(std::move(initial)) {}

EditResult Buffer::applyRange(const std::string& replacement,
                              std::int64_t from, std::int64_t to) {
  EditResult r;
  if (!validateRange(text_.size(), from, to, r.err)) {
    r.ok = false;
    return r;
  }

  const auto f = static_cast<std::size_t>(from);
  const auto t = static_cast<std::size_t>(to);
  text_.replace(f, t - f, replacement);

  r.text = text_;
  return r;
}

void Buffer::setText(std::string text) {
  text_ = std::move(text);
}

} // namespace tu
