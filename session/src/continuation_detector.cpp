#include "session/continuation_detector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

#include <llvm/ADT/StringSwitch.h>

namespace incsh {

namespace {

enum class ScanTokenKind { Word, Operator, Newline, End };

struct ScanToken {
  ScanTokenKind kind = ScanTokenKind::End;
  llvm::StringRef text;
  // Quoted or escaped somewhere, so never a reserved word.
  bool quoted = false;
};

struct PendingHeredoc {
  std::string delimiter;
  bool stripTabs = false;
};

enum class CaseState { None, ExpectSubject, ExpectIn };

constexpr std::array<llvm::StringLiteral, 23> kOperators = {
    "&>>", ";;&", "<<-", "<<<", "&&", "||", ";;", ";&",
    "|&",  ">>",  ">|",  "<&",  ">&", "<>", "&>", "<<",
    ";",   "&",   "|",   "(",   ")",  "<",  ">"};

bool isBlank(char c) noexcept { return c == ' ' || c == '\t' || c == '\r'; }

bool isOperatorChar(char c) noexcept {
  return c == ';' || c == '&' || c == '|' || c == '(' || c == ')' ||
         c == '<' || c == '>';
}

bool isRedirectOperator(llvm::StringRef op) {
  return llvm::StringSwitch<bool>(op)
      .Cases("<", ">", ">>", "<&", ">&", true)
      .Cases("<>", ">|", "&>", "&>>", "<<<", true)
      .Default(false);
}

bool isAssignmentWord(llvm::StringRef word) {
  const std::size_t eq = word.find('=');
  if (eq == 0 || eq == llvm::StringRef::npos) {
    return false;
  }
  llvm::StringRef name = word.take_front(eq);
  if (name.endswith("+")) {
    name = name.drop_back();
  }
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])) != 0) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  });
}

// Heredoc terminator as written after `<<`, with quotes and escapes removed.
std::string unquoteDelimiter(llvm::StringRef word) {
  std::string delimiter;
  for (std::size_t i = 0; i < word.size(); ++i) {
    const char c = word[i];
    if (c == '\'' || c == '"') {
      continue;
    }
    if (c == '\\' && i + 1 < word.size()) {
      delimiter += word[++i];
    } else {
      delimiter += c;
    }
  }
  return delimiter;
}

// Token classifier and opener/closer automaton in one left-to-right pass.
class Scanner {
public:
  explicit Scanner(llvm::StringRef text) : text_(text) {}

  Continuation run();

private:
  llvm::StringRef text_;
  std::size_t pos_ = 0;

  char openQuote_ = '\0';
  char openSubstitution_ = '\0';
  std::size_t commentEnd_ = llvm::StringRef::npos;

  std::vector<PendingHeredoc> heredocs_;
  std::vector<llvm::StringRef> closers_;

  bool commandPosition_ = true;
  bool expectHeredocWord_ = false;
  bool stripTabs_ = false;
  bool expectRedirectTarget_ = false;
  CaseState caseState_ = CaseState::None;
  // Between `in` (or a `;;` of the innermost case) and the `)` that ends a
  // pattern list.
  bool casePattern_ = false;

  ScanToken next();
  bool scanWord();
  bool skipSingleQuoted();
  bool skipAnsiCQuoted();
  bool skipDoubleQuoted();
  bool skipBacktick();
  bool skipBalanced(char open, char close);
  void advance(std::size_t count) {
    pos_ = std::min(pos_ + count, text_.size());
  }

  void feed(const ScanToken& token);
  void feedOperator(llvm::StringRef op);
  void feedWord(const ScanToken& token);
  void readHeredocBodies();

  [[nodiscard]] bool endsWithActiveBackslash() const;
};

ScanToken Scanner::next() {
  while (pos_ < text_.size()) {
    const char c = text_[pos_];
    if (isBlank(c)) {
      ++pos_;
    } else if (c == '\\' && pos_ + 1 < text_.size() &&
               text_[pos_ + 1] == '\n') {
      pos_ += 2;
    } else if (c == '#') {
      const std::size_t eol = text_.find('\n', pos_);
      pos_ = eol == llvm::StringRef::npos ? text_.size() : eol;
      commentEnd_ = pos_;
    } else {
      break;
    }
  }

  ScanToken token;
  if (pos_ >= text_.size()) {
    return token;
  }

  const std::size_t start = pos_;
  const char c = text_[pos_];
  if (c == '\n') {
    ++pos_;
    token.kind = ScanTokenKind::Newline;
    token.text = text_.substr(start, 1);
    return token;
  }

  // Arithmetic command or C-style for header: `<<`, `;` and `&` inside are
  // arithmetic, not shell operators. An unclosed one leaves `)` open.
  if (text_.substr(pos_).startswith("((")) {
    skipBalanced('(', ')');
    token.kind = ScanTokenKind::Word;
    token.quoted = true;
    token.text = text_.slice(start, pos_);
    return token;
  }

  const bool processSubstitution =
      (c == '<' || c == '>') && text_.substr(pos_ + 1).startswith("(");
  if (isOperatorChar(c) && !processSubstitution) {
    for (const llvm::StringLiteral op : kOperators) {
      if (text_.substr(pos_).startswith(op)) {
        pos_ += op.size();
        token.kind = ScanTokenKind::Operator;
        token.text = op;
        return token;
      }
    }
  }

  token.kind = ScanTokenKind::Word;
  token.quoted = scanWord();
  token.text = text_.slice(start, pos_);
  return token;
}

// Consumes one word. Returns true when any part of it was quoted or escaped.
// Stops early at the end of input when a quote or substitution is left open.
bool Scanner::scanWord() {
  bool quoted = false;
  while (pos_ < text_.size()) {
    const char c = text_[pos_];
    if (isBlank(c) || c == '\n') {
      break;
    }
    if (isOperatorChar(c)) {
      if ((c == '<' || c == '>') && text_.substr(pos_ + 1).startswith("(")) {
        ++pos_;
        if (!skipBalanced('(', ')')) {
          break;
        }
        continue;
      }
      break;
    }

    bool closed = true;
    switch (c) {
    case '\\':
      quoted = true;
      advance(2);
      break;
    case '\'':
      quoted = true;
      closed = skipSingleQuoted();
      break;
    case '"':
      quoted = true;
      closed = skipDoubleQuoted();
      break;
    case '`':
      quoted = true;
      closed = skipBacktick();
      break;
    case '$': {
      const llvm::StringRef rest = text_.substr(pos_ + 1);
      if (rest.startswith("(")) {
        ++pos_;
        closed = skipBalanced('(', ')');
      } else if (rest.startswith("{")) {
        ++pos_;
        closed = skipBalanced('{', '}');
      } else if (rest.startswith("'")) {
        quoted = true;
        ++pos_;
        closed = skipAnsiCQuoted();
      } else if (rest.startswith("\"")) {
        quoted = true;
        ++pos_;
        closed = skipDoubleQuoted();
      } else {
        ++pos_;
      }
      break;
    }
    default:
      ++pos_;
    }
    if (!closed) {
      break;
    }
  }
  return quoted;
}

bool Scanner::skipSingleQuoted() {
  const std::size_t close = text_.find('\'', pos_ + 1);
  if (close == llvm::StringRef::npos) {
    openQuote_ = '\'';
    pos_ = text_.size();
    return false;
  }
  pos_ = close + 1;
  return true;
}

bool Scanner::skipAnsiCQuoted() {
  std::size_t i = pos_ + 1;
  while (i < text_.size()) {
    if (text_[i] == '\\') {
      i += 2;
    } else if (text_[i] == '\'') {
      pos_ = i + 1;
      return true;
    } else {
      ++i;
    }
  }
  openQuote_ = '\'';
  pos_ = text_.size();
  return false;
}

bool Scanner::skipDoubleQuoted() {
  ++pos_;
  while (pos_ < text_.size()) {
    const char c = text_[pos_];
    if (c == '\\') {
      advance(2);
    } else if (c == '"') {
      ++pos_;
      return true;
    } else if (c == '`') {
      if (!skipBacktick()) {
        return false;
      }
    } else if (c == '$' && text_.substr(pos_ + 1).startswith("(")) {
      ++pos_;
      if (!skipBalanced('(', ')')) {
        return false;
      }
    } else {
      ++pos_;
    }
  }
  openQuote_ = '"';
  return false;
}

bool Scanner::skipBacktick() {
  ++pos_;
  while (pos_ < text_.size()) {
    const char c = text_[pos_];
    if (c == '\\') {
      advance(2);
    } else if (c == '`') {
      ++pos_;
      return true;
    } else {
      ++pos_;
    }
  }
  openQuote_ = '`';
  return false;
}

// pos_ is on the opening bracket.
bool Scanner::skipBalanced(char open, char close) {
  int depth = 0;
  while (pos_ < text_.size()) {
    const char c = text_[pos_];
    if (c == '\\') {
      advance(2);
      continue;
    }
    if (c == '\'' && open == '(') {
      if (!skipSingleQuoted()) {
        return false;
      }
      continue;
    }
    if (c == '"') {
      if (!skipDoubleQuoted()) {
        return false;
      }
      continue;
    }
    if (c == '`') {
      if (!skipBacktick()) {
        return false;
      }
      continue;
    }
    if (c == open) {
      ++depth;
    } else if (c == close && --depth == 0) {
      ++pos_;
      return true;
    }
    ++pos_;
  }
  openSubstitution_ = close;
  return false;
}

void Scanner::feed(const ScanToken& token) {
  switch (token.kind) {
  case ScanTokenKind::Newline:
    commandPosition_ = true;
    expectHeredocWord_ = false;
    expectRedirectTarget_ = false;
    if (!heredocs_.empty()) {
      readHeredocBodies();
    }
    return;
  case ScanTokenKind::Operator:
    feedOperator(token.text);
    return;
  case ScanTokenKind::Word:
    feedWord(token);
    return;
  case ScanTokenKind::End:
    return;
  }
}

void Scanner::feedOperator(llvm::StringRef op) {
  expectRedirectTarget_ = false;
  if (casePattern_) {
    if (op == ")") {
      casePattern_ = false;
      commandPosition_ = true;
    }
    if (op == ")" || op == "(" || op == "|") {
      return;
    }
  }
  if ((op == ";;" || op == ";&" || op == ";;&") && !closers_.empty() &&
      closers_.back() == "esac") {
    casePattern_ = true;
    commandPosition_ = false;
    return;
  }
  if (op == "<<" || op == "<<-") {
    expectHeredocWord_ = true;
    stripTabs_ = op == "<<-";
    return;
  }
  if (isRedirectOperator(op)) {
    expectRedirectTarget_ = true;
    return;
  }
  // Separators, pipes, case terminators and parentheses all start a command.
  commandPosition_ = true;
}

void Scanner::feedWord(const ScanToken& token) {
  if (expectHeredocWord_) {
    heredocs_.push_back({unquoteDelimiter(token.text), stripTabs_});
    expectHeredocWord_ = false;
    return;
  }
  if (expectRedirectTarget_) {
    expectRedirectTarget_ = false;
    return;
  }

  const bool plain = !token.quoted;
  switch (caseState_) {
  case CaseState::ExpectSubject:
    caseState_ = CaseState::ExpectIn;
    return;
  case CaseState::ExpectIn:
    caseState_ = CaseState::None;
    if (plain && token.text == "in") {
      casePattern_ = true;
      commandPosition_ = false;
      return;
    }
    break;
  case CaseState::None:
    break;
  }

  if (casePattern_) {
    if (plain && token.text == "esac" && !closers_.empty() &&
        closers_.back() == "esac") {
      closers_.pop_back();
      casePattern_ = false;
    }
    commandPosition_ = false;
    return;
  }

  if (!commandPosition_ || !plain) {
    commandPosition_ = false;
    return;
  }

  const llvm::StringRef closer = llvm::StringSwitch<llvm::StringRef>(token.text)
                                     .Case("if", "fi")
                                     .Cases("for", "while", "until", "done")
                                     .Case("case", "esac")
                                     .Default("");
  if (!closer.empty()) {
    closers_.push_back(closer);
    if (token.text == "case") {
      caseState_ = CaseState::ExpectSubject;
    }
    // The condition of if/while/until is itself a command.
    commandPosition_ = token.text != "for" && token.text != "case";
    return;
  }

  if (token.text == "fi" || token.text == "done" || token.text == "esac") {
    if (!closers_.empty() && closers_.back() == token.text) {
      closers_.pop_back();
    }
    commandPosition_ = false;
    return;
  }

  commandPosition_ = llvm::StringSwitch<bool>(token.text)
                         .Cases("then", "do", "else", "elif", true)
                         .Cases("{", "!", "time", true)
                         .Default(isAssignmentWord(token.text));
}

// Called right after a newline: consumes the bodies of every heredoc
// started on the line just finished, in order.
void Scanner::readHeredocBodies() {
  while (!heredocs_.empty() && pos_ < text_.size()) {
    const std::size_t eol = text_.find('\n', pos_);
    const std::size_t lineEnd = eol == llvm::StringRef::npos ? text_.size() : eol;
    llvm::StringRef line = text_.slice(pos_, lineEnd);
    pos_ = eol == llvm::StringRef::npos ? text_.size() : eol + 1;

    const PendingHeredoc& pending = heredocs_.front();
    if (pending.stripTabs) {
      line = line.ltrim(" \t");
    }
    if (line == pending.delimiter) {
      heredocs_.erase(heredocs_.begin());
    }
  }
}

bool Scanner::endsWithActiveBackslash() const {
  llvm::StringRef body = text_;
  if (body.endswith("\n")) {
    body = body.drop_back();
  }
  if (openQuote_ == '\'') {
    return false;
  }
  if (commentEnd_ != llvm::StringRef::npos && commentEnd_ >= body.size()) {
    return false;
  }
  const std::size_t lastOther = body.find_last_not_of('\\');
  const std::size_t run = lastOther == llvm::StringRef::npos
                              ? body.size()
                              : body.size() - lastOther - 1;
  return run % 2 == 1;
}

Continuation Scanner::run() {
  for (ScanToken token = next(); token.kind != ScanTokenKind::End;
       token = next()) {
    feed(token);
  }

  Continuation result;
  result.depth = closers_.size();
  if (endsWithActiveBackslash()) {
    result.kind = ContinuationKind::LineContinuation;
  } else if (openQuote_ != '\0') {
    result.kind = ContinuationKind::QuoteContinuation;
    result.awaiting = std::string(1, openQuote_);
  } else if (!heredocs_.empty()) {
    result.kind = ContinuationKind::HeredocContinuation;
    result.awaiting = heredocs_.front().delimiter;
  } else if (openSubstitution_ != '\0') {
    result.kind = ContinuationKind::StructureContinuation;
    result.awaiting = std::string(1, openSubstitution_);
    result.depth = closers_.size() + 1;
  } else if (!closers_.empty()) {
    result.kind = ContinuationKind::StructureContinuation;
    result.awaiting = closers_.back().str();
  }
  return result;
}

} // namespace

Continuation ContinuationDetector::detect(llvm::StringRef text) {
  Scanner scanner(text);
  return scanner.run();
}

llvm::StringRef ContinuationDetector::kindName(ContinuationKind kind) noexcept {
  switch (kind) {
  case ContinuationKind::Complete:
    return "complete";
  case ContinuationKind::LineContinuation:
    return "line_continuation";
  case ContinuationKind::QuoteContinuation:
    return "quote_continuation";
  case ContinuationKind::HeredocContinuation:
    return "heredoc_continuation";
  case ContinuationKind::StructureContinuation:
    return "structure_continuation";
  }
  return "unknown";
}

} // namespace incsh
