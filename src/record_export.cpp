#include "record_export.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace {

std::string valueOf(const Record& r, const std::string& column) {
  auto it = r.fields.find(column);
  return it == r.fields.end() ? std::string() : it->second;
}

std::string csvCell(const std::string& cell) {
  bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos || cell.find('\n') != std::string::npos;
  if (!needQuotes) return cell;
  std::string escaped;
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  return '"' + escaped + '"';
}

void writeDelimited(const std::vector<Record>& records,
                    const std::vector<std::string>& columns,
                    char delimiter,
                    bool quote,
                    std::ostream& out) {
  auto writeRow = [&](const std::vector<std::string>& row) {
    for (size_t i = 0; i < row.size(); ++i) {
      out << (quote ? csvCell(row[i]) : row[i]);
      if (i + 1 < row.size()) out << delimiter;
    }
    out << "\n";
  };

  writeRow(columns);
  std::vector<std::string> row(columns.size());
  for (const auto& r : records) {
    for (size_t c = 0; c < columns.size(); ++c) row[c] = valueOf(r, columns[c]);
    writeRow(row);
  }
}

void writeJson(const std::vector<Record>& records,
               const std::vector<std::string>& columns,
               std::ostream& out) {
  // ordered_json keeps the requested column order in each object.
  nlohmann::ordered_json arr = nlohmann::ordered_json::array();
  for (const auto& r : records) {
    nlohmann::ordered_json obj = nlohmann::ordered_json::object();
    for (const auto& c : columns) obj[c] = valueOf(r, c);
    arr.push_back(std::move(obj));
  }
  out << arr.dump(2) << "\n";
}

} // namespace

ExportFormat parseExportFormat(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "csv") return ExportFormat::Csv;
  if (lower == "txt") return ExportFormat::Txt;
  if (lower == "json") return ExportFormat::Json;
  throw std::invalid_argument("Unknown export format: " + name);
}

void writeRecords(const std::vector<Record>& records,
                  const std::vector<std::string>& columns,
                  ExportFormat format,
                  std::ostream& out) {
  switch (format) {
    case ExportFormat::Csv: writeDelimited(records, columns, ',', true, out); break;
    case ExportFormat::Txt: writeDelimited(records, columns, '\t', false, out); break;
    case ExportFormat::Json: writeJson(records, columns, out); break;
  }
}

void writeRecordsToFile(const std::vector<Record>& records,
                        const std::vector<std::string>& columns,
                        ExportFormat format,
                        const std::string& path) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::filesystem::create_directories(parent);
  }
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("Failed to open output file: " + path);
  }
  writeRecords(records, columns, format, ofs);
}
