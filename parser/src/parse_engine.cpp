#include "parser/parse_engine.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <tree_sitter/api.h>

#include "parser/error_reporter.hpp"

extern "C" {
const TSLanguage* tree_sitter_bash(void);
}

namespace incsh {

namespace {

constexpr std::size_t kSnippetLimit = 40;

struct CursorGuard {
  explicit CursorGuard(TSNode node) : cursor(ts_tree_cursor_new(node)) {}
  ~CursorGuard() { ts_tree_cursor_delete(&cursor); }
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;

  TSTreeCursor cursor;
};

TSPoint toTSPoint(const Point& point) {
  return {static_cast<std::uint32_t>(point.row),
          static_cast<std::uint32_t>(point.column)};
}

// tree-sitter-bash has a single while_statement for both loop keywords.
std::string kindOf(TSNode node) {
  const char* type = ts_node_type(node);
  if (std::strcmp(type, "while_statement") == 0 &&
      ts_node_child_count(node) > 0 &&
      std::strcmp(ts_node_type(ts_node_child(node, 0)), "until") == 0) {
    return "until_statement";
  }
  return type;
}

Diagnostic errorDiagnostic(TSNode node, const LineIndex& lines,
                           const std::string& text) {
  const std::size_t start = ts_node_start_byte(node);
  const std::size_t end = ts_node_end_byte(node);
  std::string snippet = text.substr(start, end - start);
  snippet = snippet.substr(0, snippet.find('\n'));
  if (snippet.size() > kSnippetLimit) {
    snippet = snippet.substr(0, kSnippetLimit) + "...";
  }
  const Point at = lines.pointAt(start);
  Diagnostic diagnostic(ErrorSeverity::Error, formatSyntaxError(snippet),
                        at.row + 1, at.column + 1);
  diagnostic.offset = start;
  diagnostic.length = end - start;
  return diagnostic;
}

class NodeBuilder {
public:
  NodeBuilder(NodeIdAllocator& ids, const LineIndex& lines,
              const std::string& text)
      : ids_(ids), lines_(lines), text_(text) {}

  // Named children only; keywords and punctuation are implied by the kind.
  RawNodePtr build(TSNode node, const char* field) {
    auto raw = std::make_shared<RawNode>();
    raw->kind = kindOf(node);
    raw->id = ids_.take();
    raw->range = lines_.rangeOf(ts_node_start_byte(node), ts_node_end_byte(node));
    raw->field = field != nullptr ? field : "";
    raw->isMissing = ts_node_is_missing(node);
    raw->hasError = ts_node_has_error(node);
    if (raw->isError()) {
      diagnostics_.push_back(errorDiagnostic(node, lines_, text_));
    }

    CursorGuard guard(node);
    if (ts_tree_cursor_goto_first_child(&guard.cursor)) {
      do {
        const TSNode child = ts_tree_cursor_current_node(&guard.cursor);
        if (ts_node_is_named(child)) {
          raw->children.push_back(build(
              child, ts_tree_cursor_current_field_name(&guard.cursor)));
        }
      } while (ts_tree_cursor_goto_next_sibling(&guard.cursor));
    }
    return raw;
  }

  std::vector<Diagnostic> takeDiagnostics() { return std::move(diagnostics_); }

private:
  NodeIdAllocator& ids_;
  const LineIndex& lines_;
  const std::string& text_;
  std::vector<Diagnostic> diagnostics_;
};

bool intersects(const std::vector<TSRange>& ranges, const SourceRange& range) {
  return std::any_of(ranges.begin(), ranges.end(), [&](const TSRange& r) {
    return r.start_byte < range.endByte && range.startByte < r.end_byte;
  });
}

} // namespace

void ShellParseEngine::ParserDeleter::operator()(TSParser* parser) const {
  ts_parser_delete(parser);
}

ShellParseEngine::ShellParseEngine() : parser_(ts_parser_new()) {
  if (!ts_parser_set_language(parser_.get(), tree_sitter_bash())) {
    throw std::runtime_error(
        "tree-sitter-bash grammar is incompatible with the tree-sitter runtime");
  }
}

ShellParseEngine::~ShellParseEngine() = default;

std::size_t ShellParseEngine::commonPrefix(const std::string& a,
                                           const std::string& b) {
  const auto mismatch =
      std::mismatch(a.begin(), a.begin() + std::min(a.size(), b.size()),
                    b.begin());
  return static_cast<std::size_t>(mismatch.first - a.begin());
}

RawTree ShellParseEngine::reparse(const RawTree* previous,
                                  const std::string& text) {
  const LineIndex lines(text);

  std::unique_ptr<TSTree, decltype(&ts_tree_delete)> edited(nullptr,
                                                            &ts_tree_delete);
  std::size_t prefix = 0;
  if (previous != nullptr && previous->syntaxTree()) {
    const std::string& oldText = previous->text();
    prefix = commonPrefix(oldText, text);
    const LineIndex oldLines(oldText);

    TSInputEdit edit;
    edit.start_byte = static_cast<std::uint32_t>(prefix);
    edit.old_end_byte = static_cast<std::uint32_t>(oldText.size());
    edit.new_end_byte = static_cast<std::uint32_t>(text.size());
    edit.start_point = toTSPoint(lines.pointAt(prefix));
    edit.old_end_point = toTSPoint(oldLines.pointAt(oldText.size()));
    edit.new_end_point = toTSPoint(lines.pointAt(text.size()));

    edited.reset(ts_tree_copy(previous->syntaxTree().get()));
    ts_tree_edit(edited.get(), &edit);
  }

  TSTree* parsed =
      ts_parser_parse_string(parser_.get(), edited.get(), text.data(),
                             static_cast<std::uint32_t>(text.size()));
  if (parsed == nullptr) {
    throw std::runtime_error("tree-sitter produced no tree for a " +
                             std::to_string(text.size()) + "-byte buffer");
  }
  std::shared_ptr<const TSTree> tree(
      parsed, [](const TSTree* t) { ts_tree_delete(const_cast<TSTree*>(t)); });

  std::vector<TSRange> changed;
  if (edited) {
    std::uint32_t count = 0;
    std::unique_ptr<TSRange, decltype(&std::free)> ranges(
        ts_tree_get_changed_ranges(edited.get(), parsed, &count), &std::free);
    if (ranges) {
      changed.assign(ranges.get(), ranges.get() + count);
    }
  }

  const TSNode program = ts_tree_root_node(parsed);
  NodeBuilder builder(ids_, lines, text);

  auto root = std::make_shared<RawNode>();
  root->kind = "program";
  root->id = ids_.take();
  root->range = lines.rangeOf(0, text.size());
  root->hasError = ts_node_has_error(program);

  // Input with no recoverable statement parses to a bare ERROR root.
  if (std::strcmp(ts_node_type(program), kErrorKind) == 0) {
    root->children.push_back(builder.build(program, nullptr));
    return RawTree(std::move(root), text, builder.takeDiagnostics(), 0,
                   std::move(tree));
  }

  std::size_t reused = 0;
  bool reusing = edited != nullptr;
  const auto* oldChildren =
      previous != nullptr ? &previous->root()->children : nullptr;

  CursorGuard guard(program);
  if (ts_tree_cursor_goto_first_child(&guard.cursor)) {
    do {
      const TSNode child = ts_tree_cursor_current_node(&guard.cursor);
      if (!ts_node_is_named(child)) {
        continue;
      }
      // The previous tree's last statement is always rebuilt.
      if (reusing && reused + 1 < oldChildren->size()) {
        const RawNodePtr& old = (*oldChildren)[reused];
        const SourceRange range =
            lines.rangeOf(ts_node_start_byte(child), ts_node_end_byte(child));
        if (!old->hasError && old->kind == kindOf(child) &&
            old->range == range && range.endByte <= prefix &&
            !intersects(changed, range)) {
          root->children.push_back(old);
          ++reused;
          continue;
        }
      }
      reusing = false;
      root->children.push_back(builder.build(
          child, ts_tree_cursor_current_field_name(&guard.cursor)));
    } while (ts_tree_cursor_goto_next_sibling(&guard.cursor));
  }

  return RawTree(std::move(root), text, builder.takeDiagnostics(), reused,
                 std::move(tree));
}

} // namespace incsh
