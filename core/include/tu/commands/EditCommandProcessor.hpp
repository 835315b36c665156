#pragma once
#include "tu/edit/EditError.hpp"
#include "tu/history/EditHistory.hpp"

#include <cstdint>
#include <string>

#include <rapidjson/document.h>

namespace tu {

class EditCommandProcessor {
public:
  explicit EditCommandProcessor(EditHistory& history);

  // Apply a single JSON command object:
  //   {"cmd":"perform","replacement":"fast","from":4,"to":9}
  //   {"cmd":"undo"} {"cmd":"redo"} {"cmd":"clear"} {"cmd":"hello"}
  EditResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  EditResult applyJsonText(const std::string& jsonText);

  // Current text, stack depths and stack contents (bottom-to-top).
  // For logging / tests; not a persistence format.
  std::string stateJson() const;

  std::uint64_t commandCount() const { return commandCounter_; }

private:
  EditHistory& history_;
  std::uint64_t commandCounter_{0};

  // ---- handlers ----
  EditResult cmdHello(const rapidjson::Value& obj);
  EditResult cmdPerform(const rapidjson::Value& obj);
  EditResult cmdUndo(const rapidjson::Value& obj);
  EditResult cmdRedo(const rapidjson::Value& obj);
  EditResult cmdClear(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static bool getInt(const rapidjson::Value& obj, const char* key, std::int64_t& out);
};

} // namespace tu
