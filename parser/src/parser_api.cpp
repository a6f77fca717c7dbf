#include "parser/parser_api.hpp"
#include "parser/error_reporter.hpp"
#include "parser/node.hpp"
#include "parser/parse_engine.hpp"
#include "parser/tree_converter.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

#include <llvm/Support/Error.h>

std::unique_ptr<incsh::ParseTree> incsh_parse(const std::string& source) {
  incsh::ShellParseEngine engine;
  const incsh::RawTree raw = engine.reparse(nullptr, source);

  auto* reporter = incsh::ErrorReporter::current();
  for (const auto& diagnostic : raw.diagnostics()) {
    if (reporter != nullptr) {
      reporter->report(diagnostic);
    } else {
      std::fprintf(stderr, "%s\n", diagnostic.format().c_str());
    }
  }

  incsh::TreeConverter converter;
  auto tree = converter.convert(raw);
  if (!tree) {
    std::cerr << "ERROR: " << llvm::toString(tree.takeError()) << '\n';
    return nullptr;
  }
  return std::make_unique<incsh::ParseTree>(std::move(*tree));
}

std::unique_ptr<incsh::ParseTree> incsh_parse_file(const char* filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    std::cerr << "ERROR: Cannot open file: " << filename << '\n';
    return nullptr;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return incsh_parse(buffer.str());
}
