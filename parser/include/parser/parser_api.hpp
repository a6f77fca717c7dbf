#ifndef INCSH_PARSER_API_HPP
#define INCSH_PARSER_API_HPP

#include <memory>
#include <string>

namespace incsh {
struct ParseTree;
} // namespace incsh

// One-shot parsing without a session. Grammar diagnostics go to
// ErrorReporter::current() when set, otherwise to stderr.
std::unique_ptr<incsh::ParseTree> incsh_parse(const std::string& source);
std::unique_ptr<incsh::ParseTree> incsh_parse_file(const char* filename);

#endif // INCSH_PARSER_API_HPP
