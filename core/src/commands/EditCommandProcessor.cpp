#include "tu/commands/EditCommandProcessor.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <vector>

namespace tu {

EditCommandProcessor::EditCommandProcessor(EditHistory& history)
  : history_(history) {}

const rapidjson::Value* EditCommandProcessor::getMember(const rapidjson::Value& obj,
                                                        const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

bool EditCommandProcessor::getInt(const rapidjson::Value& obj, const char* key,
                                  std::int64_t& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsInt64()) return false;
  out = v->GetInt64();
  return true;
}

EditResult EditCommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return editFail(EditErrorCode::BadCommand,
                    "EditCommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

EditResult EditCommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return editFail(EditErrorCode::BadCommand, "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();
  commandCounter_++;

  if (cmd == "hello") return cmdHello(obj);
  if (cmd == "perform") return cmdPerform(obj);
  if (cmd == "undo") return cmdUndo(obj);
  if (cmd == "redo") return cmdRedo(obj);
  if (cmd == "clear") return cmdClear(obj);

  return editFail(EditErrorCode::UnknownCommand,
                  "Unknown cmd",
                  std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- handlers --------------------

EditResult EditCommandProcessor::cmdHello(const rapidjson::Value&) {
  EditResult r;
  r.ok = true;
  r.text = history_.text();
  return r;
}

EditResult EditCommandProcessor::cmdPerform(const rapidjson::Value& obj) {
  const auto* repV = getMember(obj, "replacement");
  if (!repV || !repV->IsString()) {
    return editFail(EditErrorCode::BadCommand,
                    "perform: missing string field replacement",
                    R"({"field":"replacement"})");
  }

  std::int64_t from = 0;
  std::int64_t to = 0;
  if (!getInt(obj, "from", from)) {
    return editFail(EditErrorCode::BadCommand,
                    "perform: missing integer field from",
                    R"({"field":"from"})");
  }
  if (!getInt(obj, "to", to)) {
    return editFail(EditErrorCode::BadCommand,
                    "perform: missing integer field to",
                    R"({"field":"to"})");
  }

  const std::string replacement(repV->GetString(), repV->GetStringLength());
  return history_.perform(replacement, from, to);
}

EditResult EditCommandProcessor::cmdUndo(const rapidjson::Value&) {
  return history_.undo();
}

EditResult EditCommandProcessor::cmdRedo(const rapidjson::Value&) {
  return history_.redo();
}

EditResult EditCommandProcessor::cmdClear(const rapidjson::Value&) {
  history_.clear();

  EditResult r;
  r.ok = true;
  r.text = history_.text();
  return r;
}

// -------------------- Query --------------------

static void writeEdits(rapidjson::Writer<rapidjson::StringBuffer>& w,
                       const std::vector<Edit>& edits) {
  w.StartArray();
  for (const auto& e : edits) {
    w.StartObject();
    w.Key("replacement");
    w.String(e.replacement().c_str(),
             static_cast<rapidjson::SizeType>(e.replacement().size()));
    w.Key("from"); w.Uint64(e.from());
    w.Key("to");   w.Uint64(e.to());
    w.EndObject();
  }
  w.EndArray();
}

std::string EditCommandProcessor::stateJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  const std::string& text = history_.text();

  w.StartObject();

  w.Key("text");
  w.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));

  w.Key("undoCount");
  w.Uint64(history_.undoCount());

  w.Key("redoCount");
  w.Uint64(history_.redoCount());

  w.Key("netChangeOfLast");
  w.Int64(history_.netChangeOfLast());

  w.Key("past");
  writeEdits(w, history_.past());

  w.Key("future");
  writeEdits(w, history_.future());

  w.Key("commands");
  w.Uint64(commandCounter_);

  w.EndObject();

  return sb.GetString();
}

} // namespace tu
