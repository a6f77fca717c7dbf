#include "parser/error_reporter.hpp"
#include "parser/node.hpp"
#include "parser/tree_printer.hpp"
#include "session/completeness_classifier.hpp"
#include "session/continuation_detector.hpp"
#include "session/session_host.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

using namespace incsh;

namespace {

constexpr int kExitSyntaxError = 1;
constexpr int kExitIncomplete = 2;
constexpr int kExitRejected = 3;

struct Options {
  std::size_t chunkSize = 0; // 0: one fragment per line
  std::size_t maxBuffer = SessionConfig().maxBufferSize;
  bool emit = true;
  bool dumpTree = false;
  bool check = false;
  bool trace = false;
  const char* inputFile = nullptr;
};

void printUsage(const char* progName) {
  llvm::errs() << "Usage: " << progName << " [options] [file]\n";
  llvm::errs() << "Options:\n";
  llvm::errs() << "  --chunk=N       Feed input in N-byte fragments (default: "
                  "one per line)\n";
  llvm::errs() << "  --max-buffer=N  Reject input beyond N bytes\n";
  llvm::errs() << "  --no-emit       Parse only, never emit statements\n";
  llvm::errs() << "  --dump-tree     Print the final parse tree\n";
  llvm::errs() << "  --check         Print the continuation state and exit\n";
  llvm::errs() << "  --trace         Trace session events to stderr\n";
  llvm::errs() << "  --help          Show this help message\n";
}

bool parseSize(llvm::StringRef arg, llvm::StringRef flag, std::size_t& out) {
  if (!arg.consume_front(flag)) {
    return false;
  }
  unsigned long long value = 0;
  if (arg.getAsInteger(10, value) || value == 0) {
    return false;
  }
  out = static_cast<std::size_t>(value);
  return true;
}

std::vector<std::string> splitFragments(const std::string& input,
                                        std::size_t chunkSize) {
  std::vector<std::string> fragments;
  if (chunkSize > 0) {
    for (std::size_t pos = 0; pos < input.size(); pos += chunkSize) {
      fragments.push_back(input.substr(pos, chunkSize));
    }
    return fragments;
  }
  std::size_t start = 0;
  while (start < input.size()) {
    const std::size_t eol = input.find('\n', start);
    const std::size_t stop = eol == std::string::npos ? input.size() : eol + 1;
    fragments.push_back(input.substr(start, stop - start));
    start = stop;
  }
  return fragments;
}

int reportCheck(const std::string& input) {
  const Continuation state = ContinuationDetector::detect(input);
  llvm::outs() << ContinuationDetector::kindName(state.kind);
  if (!state.awaiting.empty()) {
    llvm::outs() << ": awaiting '" << state.awaiting << "'";
  }
  if (state.depth > 0) {
    llvm::outs() << " (depth " << state.depth << ")";
  }
  llvm::outs() << "\n";
  return state.isComplete() ? 0 : kExitIncomplete;
}

void reportSyntaxError(const ParseTree& tree, const Classification& result,
                       const std::string& filename) {
  std::vector<Diagnostic> diagnostics = tree.diagnostics;
  if (diagnostics.empty() && result.errorNode) {
    const Node& node = *result.errorNode;
    Diagnostic fallback(ErrorSeverity::Error,
                        "syntax error near '" + node.text + "'",
                        node.range.start.row + 1, node.range.start.column + 1);
    fallback.offset = node.range.startByte;
    fallback.length = node.range.endByte - node.range.startByte;
    diagnostics.push_back(fallback);
  }
  for (auto& diagnostic : diagnostics) {
    diagnostic.filename = filename;
    llvm::errs() << diagnostic.formatWithSource(tree.source);
  }
}

} // namespace

int main(int argc, char** argv) {
  Options options;

  for (int i = 1; i < argc; ++i) {
    const llvm::StringRef arg(argv[i]);
    if (arg.startswith("--chunk=")) {
      if (!parseSize(arg, "--chunk=", options.chunkSize)) {
        llvm::errs() << "Invalid chunk size: " << arg << "\n";
        return 1;
      }
    } else if (arg.startswith("--max-buffer=")) {
      if (!parseSize(arg, "--max-buffer=", options.maxBuffer)) {
        llvm::errs() << "Invalid buffer size: " << arg << "\n";
        return 1;
      }
    } else if (arg == "--no-emit") {
      options.emit = false;
    } else if (arg == "--dump-tree") {
      options.dumpTree = true;
    } else if (arg == "--check") {
      options.check = true;
    } else if (arg == "--trace") {
      options.trace = true;
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else if (arg.startswith("-")) {
      llvm::errs() << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    } else {
      options.inputFile = argv[i];
    }
  }

  std::string input;
  if (options.inputFile != nullptr) {
    std::ifstream file(options.inputFile);
    if (!file.is_open()) {
      llvm::errs() << "ERROR: Cannot open file: " << options.inputFile << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    input = buffer.str();
  } else {
    std::stringstream buffer;
    buffer << std::cin.rdbuf();
    input = buffer.str();
  }

  if (options.check) {
    return reportCheck(input);
  }

  SessionConfig config;
  config.sessionId = options.inputFile != nullptr ? options.inputFile : "stdin";
  config.maxBufferSize = options.maxBuffer;
  config.emitStatements = options.emit;
  if (options.trace) {
    config.trace = &llvm::errs();
  }

  SessionHost host(config);
  host.channel().subscribe(Topic::Executable, [](const SessionEvent& event) {
    llvm::outs() << "[" << event.statement.sequence << "] "
                 << event.statement.text << "\n";
  });

  for (const auto& fragment : splitFragments(input, options.chunkSize)) {
    const AppendOutcome outcome = host.append(fragment);
    if (outcome.isRejected()) {
      llvm::outs().flush();
      llvm::errs() << "rejected: " << outcome.message << "\n";
      return kExitRejected;
    }
    if (outcome.isFailed()) {
      llvm::outs().flush();
      llvm::errs() << "ERROR: " << outcome.message << "\n";
      return 1;
    }
  }

  const AppendOutcome last = host.finish();
  llvm::outs().flush();
  if (!last.isUpdated()) {
    llvm::errs() << "ERROR: " << last.message << "\n";
    return 1;
  }

  if (options.dumpTree) {
    llvm::outs() << TreePrinter::render(*last.tree->root);
    llvm::outs().flush();
  }

  const Classification& result = last.classification;
  if (result.isSyntaxError()) {
    reportSyntaxError(*last.tree, result,
                      options.inputFile != nullptr ? options.inputFile
                                                   : "<stdin>");
    return kExitSyntaxError;
  }
  if (result.isIncomplete()) {
    // No closer named: ask the lexical scan what is open.
    std::string awaited = result.expectedCloser;
    if (awaited == "unknown") {
      const Continuation state = ContinuationDetector::detect(last.tree->source);
      if (!state.awaiting.empty()) {
        awaited = state.awaiting;
      }
    }
    llvm::errs() << "incomplete: expecting '" << awaited << "'\n";
    return kExitIncomplete;
  }
  return 0;
}
