// D3.1 - EditCommandProcessor: JSON command surface

#include "tu/commands/EditCommandProcessor.hpp"
#include "tu/history/EditHistory.hpp"
#include "tu/buffer/Buffer.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: perform / undo / redo via JSON ----
  {
    tu::Buffer buf("The quick brown fox jumped over the lazy dog");
    tu::EditHistory hist(buf);
    tu::EditCommandProcessor cp(hist);

    tu::EditResult r = cp.applyJsonText(R"({"cmd":"hello"})");
    requireTrue(r.ok, "hello ok");
    requireTrue(r.text == buf.text(), "hello echoes text");

    r = cp.applyJsonText(R"({"cmd":"perform","replacement":"fast","from":4,"to":9})");
    requireTrue(r.ok, "perform ok");
    requireTrue(r.text == "The fast brown fox jumped over the lazy dog", "perform text");

    r = cp.applyJsonText(R"({"cmd":"undo"})");
    requireTrue(r.ok && r.text == "The quick brown fox jumped over the lazy dog", "undo text");

    r = cp.applyJsonText(R"({"cmd":"redo"})");
    requireTrue(r.ok && r.text == "The fast brown fox jumped over the lazy dog", "redo text");
    requireTrue(cp.commandCount() == 4, "4 commands dispatched");
    std::printf("  Test 1 (perform / undo / redo): PASS\n");
  }

  // ---- Test 2: malformed commands ----
  {
    tu::Buffer buf("abc");
    tu::EditHistory hist(buf);
    tu::EditCommandProcessor cp(hist);

    tu::EditResult r = cp.applyJsonText("not json");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::BadCommand, "invalid JSON");

    r = cp.applyJsonText("[1,2]");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::BadCommand, "non-object JSON");

    r = cp.applyJsonText(R"({"replacement":"x"})");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::BadCommand, "missing cmd");

    r = cp.applyJsonText(R"({"cmd":"explode"})");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::UnknownCommand, "unknown cmd");
    requireTrue(r.err.details.find("explode") != std::string::npos, "details name the cmd");

    r = cp.applyJsonText(R"({"cmd":"perform","from":0,"to":1})");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::BadCommand, "missing replacement");

    r = cp.applyJsonText(R"({"cmd":"perform","replacement":"x","from":"0","to":1})");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::BadCommand, "string from");
    requireTrue(r.err.details.find("from") != std::string::npos, "details name from");

    r = cp.applyJsonText(R"({"cmd":"perform","replacement":"x","from":0})");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::BadCommand, "missing to");

    requireTrue(buf.text() == "abc", "buffer untouched by bad commands");
    requireTrue(hist.undoCount() == 0, "no history from bad commands");
    std::printf("  Test 2 (malformed commands): PASS\n");
  }

  // ---- Test 3: engine errors pass through ----
  {
    tu::Buffer buf("abcdefghij");
    tu::EditHistory hist(buf);
    tu::EditCommandProcessor cp(hist);

    tu::EditResult r = cp.applyJsonText(R"({"cmd":"perform","replacement":"x","from":0,"to":1000})");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::Range, "Range passes through");

    r = cp.applyJsonText(R"({"cmd":"undo"})");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::EmptyHistory, "EmptyHistory passes through");

    r = cp.applyJsonText(R"({"cmd":"redo"})");
    requireTrue(!r.ok && r.err.code == tu::EditErrorCode::EmptyFuture, "EmptyFuture passes through");
    requireTrue(buf.text() == "abcdefghij", "buffer unchanged");
    std::printf("  Test 3 (engine errors): PASS\n");
  }

  // ---- Test 4: stateJson ----
  {
    tu::Buffer buf("abc");
    tu::EditHistory hist(buf);
    tu::EditCommandProcessor cp(hist);

    requireTrue(cp.applyJsonText(R"({"cmd":"perform","replacement":"X","from":1,"to":2})").ok,
                "perform X");
    const std::string expected =
      R"({"text":"aXc","undoCount":1,"redoCount":0,"netChangeOfLast":0,)"
      R"("past":[{"replacement":"b","from":1,"to":2}],"future":[],"commands":1})";
    requireTrue(cp.stateJson() == expected, "exact state JSON");

    requireTrue(cp.applyJsonText(R"({"cmd":"perform","replacement":"","from":0,"to":1})").ok,
                "delete a");
    requireTrue(cp.applyJsonText(R"({"cmd":"undo"})").ok, "undo delete");

    rapidjson::Document d;
    d.Parse(cp.stateJson().c_str());
    requireTrue(!d.HasParseError() && d.IsObject(), "state parses");
    requireTrue(std::string(d["text"].GetString()) == "aXc", "text after undo");
    requireTrue(d["undoCount"].GetUint64() == 1, "undoCount 1");
    requireTrue(d["redoCount"].GetUint64() == 1, "redoCount 1");
    requireTrue(d["netChangeOfLast"].GetInt64() == 1, "undo of delete adds 1");
    requireTrue(d["future"].IsArray() && d["future"].Size() == 1, "one redoer");
    requireTrue(std::string(d["future"][0]["replacement"].GetString()).empty(),
                "redoer deletes again");

    requireTrue(cp.applyJsonText(R"({"cmd":"clear"})").ok, "clear");
    d.Parse(cp.stateJson().c_str());
    requireTrue(d["undoCount"].GetUint64() == 0, "clear empties past");
    requireTrue(d["redoCount"].GetUint64() == 0, "clear empties future");
    requireTrue(std::string(d["text"].GetString()) == "aXc", "clear keeps text");
    std::printf("  Test 4 (stateJson): PASS\n");
  }

  std::printf("D3.1 edit_commands: ALL PASS\n");
  return 0;
}
