#pragma once

#include "catalog.hpp"
#include "template.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Number of sample lines fully matched by the template (MatchOutcome::Kind::Full).
std::size_t scoreTemplate(const CompiledTemplate& tmpl,
                          const std::vector<std::string>& expectedFields,
                          const std::vector<std::string>& sampleLines);

// Picks the catalog entry that fully matches the most sample lines. Ties go to
// the entry with more fields, then to the earliest entry. Entries that fail to
// compile are skipped. Never fails: an empty sample or a catalog with no
// compilable entry yields catalog[0], an empty catalog minimalDefaultTemplate().
// The returned descriptor always carries concrete field names.
TemplateDescriptor suggestTemplate(const Catalog& catalog, const std::vector<std::string>& sampleLines);

// Samples the first kSuggestionSampleSize non-empty lines of the file and runs
// suggestTemplate. An unreadable file yields catalog[0].
TemplateDescriptor suggestForFile(const std::string& path, const Catalog& catalog);
