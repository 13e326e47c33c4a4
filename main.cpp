#include "catalog.hpp"
#include "envelope.hpp"
#include "extractor.hpp"
#include "record_export.hpp"
#include "record_ops.hpp"
#include "suggester.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* const kUsage =
  "usage:\n"
  "  logextract suggest <file> [--catalog=path]\n"
  "  logextract parse <file> <pattern> <field_names_json> <true|false> [options]\n"
  "  logextract stats <file> <pattern> [--field=name] [options]\n"
  "  logextract export <file> <pattern> --out=path [--format=csv|txt|json] [--columns=a,b]\n"
  "                    [--grep=keyword] [--invert] [options]\n"
  "\n"
  "options:\n"
  "  --regex | --placeholder       template syntax (default: detected)\n"
  "  --dynamic                     derive field names from the template\n"
  "  --best-effort                 keep unmatched lines (stats/export)\n"
  "  --full-line-fallback          unmatched lines become a single FullLine field\n";

struct CliArgs {
  std::vector<std::string> positional;
  std::string catalogPath;
  std::string statsField;
  std::string outPath;
  std::string format = "csv";
  std::string columns;
  std::string grep;
  bool invert = false;
  bool bestEffort = false;
  bool dynamic = false;
  bool fullLineFallback = false;
  std::optional<TemplateSyntax> syntax;
};

CliArgs parseArgs(int argc, char** argv) {
  CliArgs a;
  auto valueOf = [](const std::string& arg, const std::string& prefix) { return arg.substr(prefix.size()); };
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--catalog=", 0) == 0) {
      a.catalogPath = valueOf(arg, "--catalog=");
    } else if (arg.rfind("--field=", 0) == 0) {
      a.statsField = valueOf(arg, "--field=");
    } else if (arg.rfind("--out=", 0) == 0) {
      a.outPath = valueOf(arg, "--out=");
    } else if (arg.rfind("--format=", 0) == 0) {
      a.format = valueOf(arg, "--format=");
    } else if (arg.rfind("--columns=", 0) == 0) {
      a.columns = valueOf(arg, "--columns=");
    } else if (arg.rfind("--grep=", 0) == 0) {
      a.grep = valueOf(arg, "--grep=");
    } else if (arg == "--invert") {
      a.invert = true;
    } else if (arg == "--best-effort") {
      a.bestEffort = true;
    } else if (arg == "--dynamic") {
      a.dynamic = true;
    } else if (arg == "--full-line-fallback") {
      a.fullLineFallback = true;
    } else if (arg == "--regex") {
      a.syntax = TemplateSyntax::Regex;
    } else if (arg == "--placeholder") {
      a.syntax = TemplateSyntax::Placeholder;
    } else if (arg.rfind("--", 0) == 0) {
      throw std::invalid_argument("Unknown flag: " + arg);
    } else {
      a.positional.push_back(arg);
    }
  }
  return a;
}

std::vector<std::string> splitColumns(const std::string& list) {
  std::vector<std::string> out;
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

std::string defaultCatalogPath(const char* argv0) {
  std::filesystem::path exeDir = std::filesystem::path(argv0).parent_path();
  return (exeDir / "patterns.json").string();
}

ExtractOptions optionsFrom(const CliArgs& a, std::vector<std::string> fieldNames) {
  ExtractOptions opts;
  opts.discipline = a.bestEffort ? Discipline::BestEffort : Discipline::Strict;
  opts.fieldSource = (a.dynamic || fieldNames.empty()) ? FieldSource::derived()
                                                       : FieldSource::fixed(std::move(fieldNames));
  opts.syntax = a.syntax;
  opts.fallback = a.fullLineFallback ? FallbackShape::FullLine : FallbackShape::CatchAllField;
  return opts;
}

int usageError(const std::string& message) {
  std::cout << errorToJson(message).dump() << "\n";
  std::cerr << kUsage;
  return 1;
}

int runSuggest(const CliArgs& a, const char* argv0) {
  if (a.positional.empty()) return usageError("Error: Missing argument for 'suggest'. (Requires: file_path)");
  Catalog catalog = loadCatalog(a.catalogPath.empty() ? defaultCatalogPath(argv0) : a.catalogPath);
  TemplateDescriptor best = suggestForFile(a.positional[0], catalog);
  std::cout << suggestionToJson(best).dump() << "\n";
  return 0;
}

int runParse(CliArgs a) {
  if (a.positional.size() < 4) {
    return usageError("Error: Missing arguments for 'parse'. (Requires: file_path, log_pattern, field_names_json, and is_best_effort)");
  }
  std::vector<std::string> fieldNames;
  try {
    fieldNames = parseFieldNamesJson(a.positional[2]);
  } catch (const CatalogError& e) {
    return usageError(e.what());
  }
  a.bestEffort = parseBoolFlag(a.positional[3]);

  ExtractionRun run = extractFile(a.positional[0], a.positional[1], optionsFrom(a, std::move(fieldNames)));
  std::cout << runToJson(run).dump() << "\n";
  return 0;
}

int runStats(const CliArgs& a) {
  if (a.positional.size() < 2) return usageError("Error: Missing arguments for 'stats'. (Requires: file_path, log_pattern)");
  ExtractionRun run = extractFile(a.positional[0], a.positional[1], optionsFrom(a, {}));
  if (!run.success) {
    std::cout << runToJson(run).dump() << "\n";
    return run.errorKind == ExtractError::NotFound ? 2 : 0;
  }

  std::vector<std::string> order = run.records.empty() ? std::vector<std::string>() : run.records.front().fieldOrder;
  std::string field = a.statsField.empty() ? defaultStatsField(order) : a.statsField;

  nlohmann::json counts = nlohmann::json::array();
  for (const auto& kv : summarizeField(run.records, field)) {
    counts.push_back({{"value", kv.first}, {"count", kv.second}});
  }
  nlohmann::json data = {
    {"field", field},
    {"total_lines", run.totalLines},
    {"matched_lines", run.matchedLines},
    {"counts", counts}
  };
  std::cout << nlohmann::json{{"success", true}, {"data", data}, {"error", nullptr}}.dump() << "\n";
  return 0;
}

int runExport(const CliArgs& a) {
  if (a.positional.size() < 2 || a.outPath.empty()) {
    return usageError("Error: Missing arguments for 'export'. (Requires: file_path, log_pattern, --out=path)");
  }
  ExportFormat format = parseExportFormat(a.format);
  ExtractionRun run = extractFile(a.positional[0], a.positional[1], optionsFrom(a, {}));
  if (!run.success) {
    std::cerr << run.error << "\n";
    return run.errorKind == ExtractError::NotFound ? 2 : 1;
  }

  std::vector<Record> records = filterRecords(run.records, a.grep, a.invert);
  std::vector<std::string> columns = splitColumns(a.columns);
  if (columns.empty() && !records.empty()) columns = records.front().fieldOrder;

  writeRecordsToFile(records, columns, format, a.outPath);
  std::cout << "Exported " << records.size() << " record(s) to '" << a.outPath << "'\n";
  return 0;
}

} // namespace

int main(int argc, char** argv)
{
  if (argc < 2) {
    return usageError("Error: Missing command. (Requires: parse, suggest, stats or export)");
  }

  try {
    const std::string command = argv[1];
    CliArgs args = parseArgs(argc, argv);

    if (command == "suggest") return runSuggest(args, argv[0]);
    if (command == "parse") return runParse(std::move(args));
    if (command == "stats") return runStats(args);
    if (command == "export") return runExport(args);

    return usageError("Unknown command: " + command);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
