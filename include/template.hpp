#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/regex.hpp>

enum class TemplateSyntax {
  Placeholder, // "{Timestamp} {Level} {Message}"
  Regex        // Perl/ECMAScript regular expression, field names supplied separately
};

// Raised for malformed patterns and for field-name/capture-group arity mismatches.
class TemplateError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct CompiledTemplate {
  std::string pattern;
  TemplateSyntax syntax = TemplateSyntax::Placeholder;

  // Named fields in order of first appearance (deduplicated).
  std::vector<std::string> namedFields;
  // namedFields followed by the synthetic names of unnamed captures.
  std::vector<std::string> fields;
  // Regex group index for each entry of `fields`.
  std::vector<std::size_t> groups;

  boost::regex matcher;

  // Last named field, or the last field when the template has no named fields.
  const std::string& catchAllField() const;
};

struct MatchOutcome {
  enum class Kind { None, Partial, Full };

  Kind kind = Kind::None;
  // Trimmed value of every capture that participated in the match.
  std::map<std::string, std::string> values;
  // How many of the expected fields received a value.
  std::size_t populated = 0;
};

// True if the pattern uses "{}", "{Identifier}" or "{Identifier:spec}" placeholders.
TemplateSyntax detectSyntax(const std::string& pattern);

// Compiles a template. For Regex syntax a non-empty `fieldNames` must have exactly
// one name per capture group; an empty list names the groups unnamed_1..N.
// `fieldNames` is ignored for Placeholder syntax, whose names come from the pattern.
// Throws TemplateError.
CompiledTemplate compileTemplate(const std::string& pattern,
                                 TemplateSyntax syntax,
                                 const std::vector<std::string>& fieldNames = {});

// Non-throwing variant; on failure returns nullopt and stores the diagnostic in `error`.
std::optional<CompiledTemplate> tryCompileTemplate(const std::string& pattern,
                                                   TemplateSyntax syntax,
                                                   const std::vector<std::string>& fieldNames,
                                                   std::string* error = nullptr);

// Matches from the start of the line. The outcome is Full when the template's
// captures are exactly the expected fields, all populated; Partial when the pattern
// matched but some expected field is empty or the template captured other fields.
// A line the engine gives up on (match complexity or memory) is None.
MatchOutcome matchLine(const CompiledTemplate& tmpl, const std::string& line);
MatchOutcome matchLine(const CompiledTemplate& tmpl,
                       const std::string& line,
                       const std::vector<std::string>& expectedFields);
