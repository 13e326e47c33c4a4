#pragma once

#include "extractor.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// Keeps records where any field value contains `keyword` (case-insensitive),
// or the records where none does when `invert` is set. An empty keyword keeps all.
std::vector<Record> filterRecords(const std::vector<Record>& records, const std::string& keyword, bool invert = false);

// Occurrences of each distinct value of `field`, most frequent first, ties by value.
// Records without the field are counted under "N/A".
std::vector<std::pair<std::string, std::size_t>> summarizeField(const std::vector<Record>& records,
                                                                const std::string& field);

// "Level" (any case) if present in the order, otherwise the first field.
std::string defaultStatsField(const std::vector<std::string>& fieldOrder);
