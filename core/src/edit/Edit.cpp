#include "tu/edit/Edit.hpp"
#include "tu/buffer/TextBuffer.hpp"

#include <string>
#include <utility>

namespace tu {

static std::string rangeDetails(std::int64_t from, std::int64_t to, std::size_t length) {
  return std::string(R"({"from":)") + std::to_string(from) +
         R"(,"to":)" + std::to_string(to) +
         R"(,"length":)" + std::to_string(length) + "}";
}

bool validateRange(std::size_t length, std::int64_t from, std::int64_t to,
                   EditError& err) {
  if (from < 0 || to < 0 || from > to ||
      static_cast<std::uint64_t>(to) > static_cast<std::uint64_t>(length)) {
    err.code = EditErrorCode::Range;
    err.message = "range outside text or from > to";
    err.details = rangeDetails(from, to, length);
    return false;
  }
  return true;
}

Edit::Edit(std::string replacement, std::string removed,
           std::size_t from, std::size_t to)
  : replacement_(std::move(replacement)), removed_(std::move(removed)),
    from_(from), to_(to) {}

bool Edit::make(const std::string& text,
                const std::string& replacement,
                std::int64_t from, std::int64_t to,
                Edit& out, EditError& err) {
  if (!validateRange(text.size(), from, to, err)) return false;

  const auto f = static_cast<std::size_t>(from);
  const auto t = static_cast<std::size_t>(to);
  out = Edit(replacement, text.substr(f, t - f), f, t);
  return true;
}

std::int64_t Edit::netChange() const {
  return static_cast<std::int64_t>(replacement_.size()) -
         static_cast<std::int64_t>(to_ - from_);
}

Edit Edit::reversed() const {
  return Edit(removed_, replacement_, from_, from_ + replacement_.size());
}

bool Edit::canApplyTo(const std::string& text) const {
  if (to_ > text.size()) return false;
  return text.compare(from_, to_ - from_, removed_) == 0;
}

EditResult Edit::apply(TextBuffer& buffer) const {
  if (!canApplyTo(buffer.text())) {
    return editFail(EditErrorCode::StaleEdit,
                    "Edit::apply: offsets no longer match buffer content",
                    rangeDetails(static_cast<std::int64_t>(from_),
                                 static_cast<std::int64_t>(to_),
                                 buffer.length()));
  }
  return buffer.applyRange(replacement_,
                           static_cast<std::int64_t>(from_),
                           static_cast<std::int64_t>(to_));
}

bool Edit::operator==(const Edit& o) const {
  return from_ == o.from_ && to_ == o.to_ &&
         replacement_ == o.replacement_ && removed_ == o.removed_;
}

} // namespace tu
