#pragma once

#include "extractor.hpp"

#include <ostream>
#include <string>
#include <vector>

enum class ExportFormat { Csv, Txt, Json };

// Accepts "csv", "txt" or "json" (any case). Throws std::invalid_argument otherwise.
ExportFormat parseExportFormat(const std::string& name);

// Writes the selected columns, in order, with a header row (CSV/TXT) or as a JSON
// array of objects. Fields a record lacks are written as empty values.
void writeRecords(const std::vector<Record>& records,
                  const std::vector<std::string>& columns,
                  ExportFormat format,
                  std::ostream& out);

// Creates the parent directory if needed. Throws std::runtime_error if the file cannot be written.
void writeRecordsToFile(const std::vector<Record>& records,
                        const std::vector<std::string>& columns,
                        ExportFormat format,
                        const std::string& path);
