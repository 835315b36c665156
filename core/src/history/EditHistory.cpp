#include "tu/history/EditHistory.hpp"

#include <cstdio>
#include <utility>

namespace tu {

EditHistory::EditHistory(TextBuffer& buffer) : buffer_(buffer) {}

void EditHistory::setConfig(const EditHistoryConfig& cfg) {
  config_ = cfg;
  trimPast();
}

EditResult EditHistory::perform(const std::string& replacement,
                                std::int64_t from, std::int64_t to) {
  Edit doer;
  EditError err;
  if (!Edit::make(buffer_.text(), replacement, from, to, doer, err)) {
    EditResult r;
    r.ok = false;
    r.err = std::move(err);
    return r;
  }

  // Reverse against the pre-apply text; doer.removed() holds it.
  Edit undoer = doer.reversed();
  EditResult r = doer.apply(buffer_);
  if (!r.ok) return r;

  past_.push_back(std::move(undoer));
  future_.clear();
  trimPast();
  lastNetChange_ = doer.netChange();

  if (config_.traceOperations) {
    std::fprintf(stderr, "[EditHistory] perform [%lld,%lld) net=%lld past=%zu\n",
                 static_cast<long long>(from), static_cast<long long>(to),
                 static_cast<long long>(lastNetChange_), past_.size());
  }
  return r;
}

EditResult EditHistory::undo() {
  if (past_.empty()) {
    return editFail(EditErrorCode::EmptyHistory, "undo: nothing to undo");
  }
  return transfer(past_, future_, "undo");
}

EditResult EditHistory::redo() {
  if (future_.empty()) {
    return editFail(EditErrorCode::EmptyFuture, "redo: nothing to redo");
  }
  EditResult r = transfer(future_, past_, "redo");
  if (r.ok) trimPast();
  return r;
}

EditResult EditHistory::transfer(std::vector<Edit>& from, std::vector<Edit>& to,
                                 const char* op) {
  const Edit& entry = from.back();
  Edit inverse = entry.reversed();

  EditResult r = entry.apply(buffer_);
  if (!r.ok) {
    // Only reachable if the buffer was mutated behind the engine's back.
    std::fprintf(stderr, "[EditHistory] %s: %s %s %s\n", op,
                 errorCodeName(r.err.code), r.err.message.c_str(),
                 r.err.details.c_str());
    return r;
  }

  lastNetChange_ = entry.netChange();
  from.pop_back();
  to.push_back(std::move(inverse));

  if (config_.traceOperations) {
    std::fprintf(stderr, "[EditHistory] %s net=%lld past=%zu future=%zu\n", op,
                 static_cast<long long>(lastNetChange_), past_.size(), future_.size());
  }
  return r;
}

void EditHistory::trimPast() {
  if (config_.maxUndoDepth == 0 || past_.size() <= config_.maxUndoDepth) return;
  const auto excess = past_.size() - config_.maxUndoDepth;
  past_.erase(past_.begin(), past_.begin() + static_cast<std::ptrdiff_t>(excess));
}

bool EditHistory::canUndo() const { return !past_.empty(); }
bool EditHistory::canRedo() const { return !future_.empty(); }

std::size_t EditHistory::undoCount() const { return past_.size(); }
std::size_t EditHistory::redoCount() const { return future_.size(); }

const Edit* EditHistory::peekUndo() const {
  return past_.empty() ? nullptr : &past_.back();
}

const Edit* EditHistory::peekRedo() const {
  return future_.empty() ? nullptr : &future_.back();
}

void EditHistory::clear() {
  past_.clear();
  future_.clear();
  lastNetChange_ = 0;
}

} // namespace tu
