#include "suggester.hpp"
#include "line_reader.hpp"

#include <iostream>
#include <optional>

namespace {

struct Candidate {
  const TemplateDescriptor* entry = nullptr;
  CompiledTemplate compiled;
  std::vector<std::string> expectedFields;
};

std::optional<Candidate> prepare(const TemplateDescriptor& entry) {
  TemplateSyntax syntax = detectSyntax(entry.pattern);
  auto compiled = tryCompileTemplate(entry.pattern, syntax, entry.fieldNames);
  if (!compiled) return std::nullopt;

  Candidate c;
  c.entry = &entry;
  c.expectedFields = entry.hasFieldNames ? entry.fieldNames : compiled->fields;
  c.compiled = std::move(*compiled);
  return c;
}

TemplateDescriptor withConcreteFields(const TemplateDescriptor& entry) {
  if (entry.hasFieldNames) return entry;
  TemplateDescriptor d = entry;
  if (auto compiled = tryCompileTemplate(entry.pattern, detectSyntax(entry.pattern), {})) {
    d.fieldNames = compiled->fields;
    d.hasFieldNames = true;
  }
  return d;
}

} // namespace

std::size_t scoreTemplate(const CompiledTemplate& tmpl,
                          const std::vector<std::string>& expectedFields,
                          const std::vector<std::string>& sampleLines) {
  std::size_t score = 0;
  for (const auto& line : sampleLines) {
    if (matchLine(tmpl, line, expectedFields).kind == MatchOutcome::Kind::Full) score++;
  }
  return score;
}

TemplateDescriptor suggestTemplate(const Catalog& catalog, const std::vector<std::string>& sampleLines) {
  if (catalog.empty()) return minimalDefaultTemplate();
  if (sampleLines.empty()) return withConcreteFields(catalog.front());

  const TemplateDescriptor* best = nullptr;
  std::size_t bestScore = 0;
  std::size_t bestFieldCount = 0;

  for (const auto& entry : catalog) {
    auto candidate = prepare(entry);
    if (!candidate) continue;

    std::size_t score = scoreTemplate(candidate->compiled, candidate->expectedFields, sampleLines);
    std::size_t fieldCount = candidate->expectedFields.size();
    // Strict comparisons keep the earliest entry on a full tie.
    if (!best || score > bestScore || (score == bestScore && fieldCount > bestFieldCount)) {
      best = candidate->entry;
      bestScore = score;
      bestFieldCount = fieldCount;
    }
  }

  return withConcreteFields(best ? *best : catalog.front());
}

TemplateDescriptor suggestForFile(const std::string& path, const Catalog& catalog) {
  std::vector<std::string> sample;
  try {
    sample = readNonEmptyLines(path, kSuggestionSampleSize);
  } catch (const FileNotFoundError& e) {
    std::cerr << "ERROR: " << e.what() << ". Defaulting to first pattern.\n";
  }
  return suggestTemplate(catalog, sample);
}
