// D2.4 - Console walk-through of perform / undo / redo
//
// Usage: d2_4_history_demo [--trace]

#include "tu/buffer/Buffer.hpp"
#include "tu/commands/EditCommandProcessor.hpp"
#include "tu/history/EditHistory.hpp"

#include <cstdio>
#include <cstring>

static void show(const char* label, const tu::EditResult& r) {
  if (r.ok) {
    std::printf("%-22s \"%s\"\n", label, r.text.c_str());
  } else {
    std::printf("%-22s %s: %s %s\n", label, tu::errorCodeName(r.err.code),
                r.err.message.c_str(), r.err.details.c_str());
  }
}

int main(int argc, char** argv) {
  tu::EditHistoryConfig cfg;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--trace") == 0) cfg.traceOperations = true;
  }

  tu::Buffer buf("The quick brown fox jumped over the lazy dog");
  tu::EditHistory hist(buf);
  hist.setConfig(cfg);
  tu::EditCommandProcessor cp(hist);

  std::printf("%-22s \"%s\"\n", "initial", buf.text().c_str());
  show("perform fast [4,9)", hist.perform("fast", 4, 9));
  show("perform canine [40,43)", hist.perform("canine", 40, 43));
  show("undo", hist.undo());
  show("undo", hist.undo());
  show("redo", hist.redo());
  show("redo", hist.redo());
  show("redo (nothing left)", hist.redo());

  // A new edit after undo discards the redo branch.
  show("undo", hist.undo());
  show("perform very quick", cp.applyJsonText(
      R"({"cmd":"perform","replacement":"very quick","from":4,"to":8})"));
  show("redo (discarded)", cp.applyJsonText(R"({"cmd":"redo"})"));

  std::printf("state: %s\n", cp.stateJson().c_str());
  return 0;
}
