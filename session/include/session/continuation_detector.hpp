#ifndef INCSH_CONTINUATION_DETECTOR_HPP
#define INCSH_CONTINUATION_DETECTOR_HPP

#include <cstddef>
#include <string>

#include <llvm/ADT/StringRef.h>

namespace incsh {

enum class ContinuationKind {
  Complete,
  LineContinuation,
  QuoteContinuation,
  HeredocContinuation,
  StructureContinuation,
};

/// Why buffered text does or does not need more input.
struct Continuation {
  ContinuationKind kind = ContinuationKind::Complete;
  /// The open quote character, the heredoc terminator word or the innermost
  /// expected closer. Empty when complete or for a line continuation.
  std::string awaiting;
  /// Number of unmatched compound-statement openers.
  std::size_t depth = 0;

  [[nodiscard]] bool isComplete() const noexcept {
    return kind == ContinuationKind::Complete;
  }
};

// Lexical check of buffered shell input, run before anything is parsed.
// Stateless: every call rescans the whole text.
class ContinuationDetector {
public:
  /// Classify buffered text.
  /// @param text Everything buffered so far
  /// @return The highest-priority open construct, or Complete
  [[nodiscard]] static Continuation detect(llvm::StringRef text);

  [[nodiscard]] static bool isReadyToParse(llvm::StringRef text) {
    return detect(text).isComplete();
  }

  /// Lower-case snake name, e.g. "quote_continuation".
  [[nodiscard]] static llvm::StringRef kindName(ContinuationKind kind) noexcept;
};

} // namespace incsh

#endif // INCSH_CONTINUATION_DETECTOR_HPP
