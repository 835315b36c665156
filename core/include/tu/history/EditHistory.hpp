#pragma once
#include "tu/buffer/TextBuffer.hpp"
#include "tu/edit/Edit.hpp"
#include "tu/edit/EditError.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tu {

struct EditHistoryConfig {
  std::size_t maxUndoDepth{0};   // 0 = unlimited; oldest undo entries drop first
  bool traceOperations{false};   // log perform/undo/redo to stderr
};

// Undo/redo engine over a TextBuffer.
//
// past holds undoers (inverse of each forward action), future holds
// redoers (inverse of each undo). Every operation validates before it
// mutates anything: a failed call leaves the buffer and both stacks as
// they were.
class EditHistory {
public:
  explicit EditHistory(TextBuffer& buffer);

  void setConfig(const EditHistoryConfig& cfg);
  const EditHistoryConfig& config() const { return config_; }

  // Replace text[from, to) and push the inverse onto past.
  // Clears future (a new edit invalidates the offsets of queued redoers).
  EditResult perform(const std::string& replacement, std::int64_t from, std::int64_t to);

  // Pop from past, apply, push the inverse onto future.
  // Fails with EmptyHistory when there is nothing to undo.
  EditResult undo();

  // Pop from future, apply, push the inverse onto past.
  // Fails with EmptyFuture when there is nothing to redo.
  EditResult redo();

  // Net length change of the edit most recently applied by
  // perform/undo/redo. 0 before any operation and after clear().
  std::int64_t netChangeOfLast() const { return lastNetChange_; }

  bool canUndo() const;
  bool canRedo() const;

  std::size_t undoCount() const;
  std::size_t redoCount() const;

  // Top of each stack, or nullptr when empty.
  const Edit* peekUndo() const;
  const Edit* peekRedo() const;

  // Bottom-to-top.
  const std::vector<Edit>& past() const { return past_; }
  const std::vector<Edit>& future() const { return future_; }

  // Drop both stacks. The buffer is not touched.
  void clear();

  const std::string& text() const { return buffer_.text(); }

private:
  // Shared by undo/redo: apply the top of `from`, move its inverse onto `to`.
  EditResult transfer(std::vector<Edit>& from, std::vector<Edit>& to, const char* op);

  void trimPast();

  TextBuffer& buffer_;
  EditHistoryConfig config_;
  std::vector<Edit> past_;
  std::vector<Edit> future_;
  std::int64_t lastNetChange_{0};
};

} // namespace tu
