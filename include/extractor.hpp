#pragma once

#include "template.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Strict drops non-conforming lines; BestEffort emits a fallback record for them.
enum class Discipline { Strict, BestEffort };

enum class FallbackShape {
  CatchAllField, // "---" in every field, "[UNPARSED] <line>" in the catch-all field
  FullLine       // one synthetic "FullLine" field holding the line
};

// Where a run's field order comes from: caller-supplied names used verbatim,
// or the fields the template itself declares.
struct FieldSource {
  enum class Kind { Static, Derived };

  Kind kind = Kind::Derived;
  std::vector<std::string> names;

  static FieldSource fixed(std::vector<std::string> names);
  static FieldSource derived();
};

struct ExtractOptions {
  Discipline discipline = Discipline::Strict;
  FieldSource fieldSource = FieldSource::derived();
  // Detected from the pattern when unset.
  std::optional<TemplateSyntax> syntax;
  FallbackShape fallback = FallbackShape::CatchAllField;
};

struct Record {
  std::map<std::string, std::string> fields;
  std::vector<std::string> fieldOrder;
};

enum class ExtractError { None, NotFound, InvalidTemplate, NoMatchInStrictMode };

struct ExtractionRun {
  bool success = false;
  ExtractError errorKind = ExtractError::None;
  std::string error;
  std::size_t totalLines = 0;
  std::size_t matchedLines = 0;
  // Empty whenever success is false.
  std::vector<Record> records;
};

extern const char* const kFallbackPlaceholder;
extern const char* const kUnparsedPrefix;
extern const char* const kFullLineField;

// Runs a template over in-memory lines. Lines are trimmed and blank lines skipped.
// Never throws for template or matching problems; they are reported in the run.
ExtractionRun extractLines(const std::vector<std::string>& lines,
                           const std::string& pattern,
                           const ExtractOptions& options);

// Same as extractLines, streaming the lines of a file.
ExtractionRun extractFile(const std::string& path,
                          const std::string& pattern,
                          const ExtractOptions& options);
