#include "extractor.hpp"
#include "line_reader.hpp"

#include <utility>

const char* const kFallbackPlaceholder = "---";
const char* const kUnparsedPrefix = "[UNPARSED] ";
const char* const kFullLineField = "FullLine";

FieldSource FieldSource::fixed(std::vector<std::string> names) {
  FieldSource s;
  s.kind = Kind::Static;
  s.names = std::move(names);
  return s;
}

FieldSource FieldSource::derived() {
  return FieldSource{};
}

namespace {

bool usesStaticNames(const FieldSource& source) {
  return source.kind == FieldSource::Kind::Static && !source.names.empty();
}

ExtractionRun failedRun(ExtractError kind, std::string message) {
  ExtractionRun run;
  run.success = false;
  run.errorKind = kind;
  run.error = std::move(message);
  return run;
}

// Accumulates records line by line for one run.
class LineExtractor {
public:
  LineExtractor(const CompiledTemplate& tmpl, const ExtractOptions& options)
    : tmpl_(tmpl), options_(options) {
    if (usesStaticNames(options.fieldSource)) {
      fieldOrder_ = options.fieldSource.names;
      catchAll_ = fieldOrder_.back();
    } else {
      fieldOrder_ = tmpl.fields;
      catchAll_ = tmpl.catchAllField();
    }
  }

  void consume(const std::string& line) {
    run_.totalLines++;
    MatchOutcome outcome = matchLine(tmpl_, line, fieldOrder_);

    // Only the run's own fields need values; extra captures from the template are ignored.
    if (outcome.kind != MatchOutcome::Kind::None && outcome.populated == fieldOrder_.size()) {
      run_.matchedLines++;
      Record r;
      r.fieldOrder = fieldOrder_;
      for (const auto& name : fieldOrder_) r.fields[name] = outcome.values[name];
      run_.records.push_back(std::move(r));
      return;
    }

    if (options_.discipline == Discipline::BestEffort) {
      run_.records.push_back(fallbackRecord(line));
    }
  }

  ExtractionRun finish() {
    if (options_.discipline == Discipline::Strict && run_.records.empty() && run_.totalLines > 0) {
      ExtractionRun failed = failedRun(
        ExtractError::NoMatchInStrictMode,
        "The custom template matched 0 of " + std::to_string(run_.totalLines) +
        " lines. Please verify your template.");
      failed.totalLines = run_.totalLines;
      return failed;
    }
    run_.success = true;
    return std::move(run_);
  }

private:
  Record fallbackRecord(const std::string& line) const {
    Record r;
    if (options_.fallback == FallbackShape::FullLine) {
      r.fieldOrder = {kFullLineField};
      r.fields[kFullLineField] = line;
      return r;
    }
    r.fieldOrder = fieldOrder_;
    for (const auto& name : fieldOrder_) {
      if (name != catchAll_) r.fields[name] = kFallbackPlaceholder;
    }
    r.fields[catchAll_] = kUnparsedPrefix + line;
    return r;
  }

  const CompiledTemplate& tmpl_;
  const ExtractOptions& options_;
  std::vector<std::string> fieldOrder_;
  std::string catchAll_;
  ExtractionRun run_;
};

std::optional<CompiledTemplate> compileForRun(const std::string& pattern,
                                              const ExtractOptions& options,
                                              std::string& error) {
  TemplateSyntax syntax = options.syntax ? *options.syntax : detectSyntax(pattern);
  // Static names give regex groups their names; placeholder names come from the pattern.
  std::vector<std::string> names;
  if (syntax == TemplateSyntax::Regex && usesStaticNames(options.fieldSource)) {
    names = options.fieldSource.names;
  }
  return tryCompileTemplate(pattern, syntax, names, &error);
}

} // namespace

ExtractionRun extractLines(const std::vector<std::string>& lines,
                           const std::string& pattern,
                           const ExtractOptions& options) {
  std::string error;
  auto tmpl = compileForRun(pattern, options, error);
  if (!tmpl) return failedRun(ExtractError::InvalidTemplate, error);

  LineExtractor extractor(*tmpl, options);
  for (const auto& raw : lines) {
    std::string line = trim(raw);
    if (!line.empty()) extractor.consume(line);
  }
  return extractor.finish();
}

ExtractionRun extractFile(const std::string& path,
                          const std::string& pattern,
                          const ExtractOptions& options) {
  std::string error;
  auto tmpl = compileForRun(pattern, options, error);
  if (!tmpl) return failedRun(ExtractError::InvalidTemplate, error);

  LineExtractor extractor(*tmpl, options);
  try {
    forEachNonEmptyLine(path, [&](const std::string& line) {
      extractor.consume(line);
      return true;
    });
  } catch (const FileNotFoundError& e) {
    return failedRun(ExtractError::NotFound, e.what());
  }
  return extractor.finish();
}
