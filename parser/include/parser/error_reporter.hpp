#ifndef INCSH_ERROR_REPORTER_HPP
#define INCSH_ERROR_REPORTER_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace incsh {

/// Severity level for parser diagnostics.
enum class ErrorSeverity { Warning, Error, Fatal };

/// A single diagnostic with location information. Line and column are
/// one-based; offset/length locate the offending bytes in the source.
struct Diagnostic {
  ErrorSeverity severity;
  std::string message;
  std::string filename;
  int line;
  int column;
  std::size_t offset = 0;
  std::size_t length = 0;

  Diagnostic(ErrorSeverity sev, std::string msg, int l = 0, int c = 0)
      : severity(sev), message(std::move(msg)), line(l), column(c) {}

  /// Format the diagnostic as a human-readable string.
  [[nodiscard]] std::string format() const;

  /// Render the diagnostic against the source it refers to: the offending
  /// line followed by a caret (via llvm::SourceMgr).
  [[nodiscard]] std::string formatWithSource(const std::string& source) const;
};

/// Collects diagnostics and forwards them to a callback or stderr.
class ErrorReporter {
public:
  using ErrorCallback = std::function<void(const Diagnostic&)>;

  ErrorReporter() = default;

  /// Get the thread-local current error reporter.
  /// Returns nullptr if no reporter is set.
  static ErrorReporter* current();

  /// Set the current thread-local error reporter.
  static void setCurrent(ErrorReporter* reporter);

  /// Report an error with the given severity, message, and optional location.
  void report(ErrorSeverity severity, const std::string& message, int line = 0,
              int column = 0);

  /// Report an already built diagnostic (keeps its offset and length).
  void report(Diagnostic diagnostic);

  /// Convenience methods for common error severities.
  void warning(const std::string& message, int line = 0, int column = 0);
  void error(const std::string& message, int line = 0, int column = 0);
  void fatal(const std::string& message, int line = 0, int column = 0);

  /// Set a callback to be invoked for each diagnostic reported. While a
  /// callback is set nothing is printed to stderr.
  void setCallback(ErrorCallback cb);

  /// Set the current filename for error messages.
  void setFilename(const std::string& filename);

  /// Get all diagnostics collected so far.
  [[nodiscard]] const std::vector<Diagnostic>& errors() const {
    return errorList;
  }

  /// Check if any errors have been reported.
  [[nodiscard]] bool hasErrors() const;

  /// Check if any warnings have been reported.
  [[nodiscard]] bool hasWarnings() const;

  /// Clear all collected diagnostics.
  void clear();

private:
  std::vector<Diagnostic> errorList;
  ErrorCallback errorCallback;
  std::string currentFilename;
};

/// Format the message for a region the grammar could not parse.
/// @param snippet The first line of the region, possibly shortened
[[nodiscard]] inline std::string formatSyntaxError(const std::string& snippet) {
  if (snippet.empty()) {
    return "syntax error";
  }
  return "syntax error near '" + snippet + "'";
}

} // namespace incsh

#endif // INCSH_ERROR_REPORTER_HPP
