#pragma once
#include "tu/buffer/TextBuffer.hpp"

#include <string>

namespace tu {

class Buffer : public TextBuffer {
public:
  Buffer() = default;
  explicit Buffer(std::string initial);

  const std::string& text() const override { return text_; }
  std::size_t length() const override { return text_.size(); }

  EditResult applyRange(const std::string& replacement,
                        std::int64_t from, std::int64_t to) override;

  // Host-side load. Not an edit; callers owning an EditHistory over this
  // buffer should clear() it afterwards.
  void setText(std::string text);

private:
  std::string text_;
};

} // namespace tu
