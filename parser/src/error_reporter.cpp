#include "parser/error_reporter.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/raw_ostream.h>

namespace incsh {

// Thread-local pointer to the current error reporter
static thread_local ErrorReporter* currentReporter = nullptr;

std::string Diagnostic::format() const {
  std::ostringstream oss;

  if (!filename.empty()) {
    oss << filename << ": ";
  }

  // Severity prefix
  switch (severity) {
  case ErrorSeverity::Warning:
    oss << "warning: ";
    break;
  case ErrorSeverity::Error:
    oss << "error: ";
    break;
  case ErrorSeverity::Fatal:
    oss << "fatal error: ";
    break;
  }

  oss << message;

  // Location (if available)
  if (line > 0) {
    oss << " at line " << line;
    if (column > 0) {
      oss << ", column " << column;
    }
  }

  return oss.str();
}

std::string Diagnostic::formatWithSource(const std::string& source) const {
  llvm::SourceMgr sourceMgr;
  const std::string bufferName = filename.empty() ? "<input>" : filename;
  sourceMgr.AddNewSourceBuffer(
      llvm::MemoryBuffer::getMemBufferCopy(source, bufferName), llvm::SMLoc());
  const char* bufferStart =
      sourceMgr.getMemoryBuffer(sourceMgr.getMainFileID())->getBufferStart();

  const std::size_t start = std::min(offset, source.size());
  const std::size_t stop = std::min(start + length, source.size());
  const llvm::SMLoc loc = llvm::SMLoc::getFromPointer(bufferStart + start);

  llvm::SourceMgr::DiagKind kind = llvm::SourceMgr::DK_Error;
  if (severity == ErrorSeverity::Warning) {
    kind = llvm::SourceMgr::DK_Warning;
  }

  std::string rendered;
  llvm::raw_string_ostream os(rendered);
  if (stop > start) {
    const llvm::SMRange range(loc,
                              llvm::SMLoc::getFromPointer(bufferStart + stop));
    sourceMgr.PrintMessage(os, loc, kind, message, {range});
  } else {
    sourceMgr.PrintMessage(os, loc, kind, message);
  }
  return os.str();
}

ErrorReporter* ErrorReporter::current() { return currentReporter; }

void ErrorReporter::setCurrent(ErrorReporter* reporter) {
  currentReporter = reporter;
}

void ErrorReporter::report(ErrorSeverity severity, const std::string& message,
                           int line, int column) {
  report(Diagnostic(severity, message, line, column));
}

void ErrorReporter::report(Diagnostic diagnostic) {
  if (diagnostic.filename.empty()) {
    diagnostic.filename = currentFilename;
  }
  errorList.push_back(diagnostic);

  if (errorCallback) {
    errorCallback(diagnostic);
    return;
  }

  // Default behavior: print to stderr
  std::fprintf(stderr, "%s\n", diagnostic.format().c_str());
}

void ErrorReporter::warning(const std::string& message, int line, int column) {
  report(ErrorSeverity::Warning, message, line, column);
}

void ErrorReporter::error(const std::string& message, int line, int column) {
  report(ErrorSeverity::Error, message, line, column);
}

void ErrorReporter::fatal(const std::string& message, int line, int column) {
  report(ErrorSeverity::Fatal, message, line, column);
}

void ErrorReporter::setCallback(ErrorCallback cb) {
  errorCallback = std::move(cb);
}

void ErrorReporter::setFilename(const std::string& filename) {
  currentFilename = filename;
}

bool ErrorReporter::hasErrors() const {
  return std::any_of(errorList.begin(), errorList.end(), [](const auto& err) {
    return err.severity == ErrorSeverity::Error ||
           err.severity == ErrorSeverity::Fatal;
  });
}

bool ErrorReporter::hasWarnings() const {
  return std::any_of(errorList.begin(), errorList.end(), [](const auto& err) {
    return err.severity == ErrorSeverity::Warning;
  });
}

void ErrorReporter::clear() { errorList.clear(); }

} // namespace incsh
