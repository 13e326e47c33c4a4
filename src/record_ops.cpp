#include "record_ops.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool recordContains(const Record& r, const std::string& lowerKeyword) {
  for (const auto& kv : r.fields) {
    if (toLower(kv.second).find(lowerKeyword) != std::string::npos) return true;
  }
  return false;
}

} // namespace

std::vector<Record> filterRecords(const std::vector<Record>& records, const std::string& keyword, bool invert) {
  if (keyword.empty()) return records;

  const std::string needle = toLower(keyword);
  std::vector<Record> out;
  for (const auto& r : records) {
    if (recordContains(r, needle) != invert) out.push_back(r);
  }
  return out;
}

std::vector<std::pair<std::string, std::size_t>> summarizeField(const std::vector<Record>& records,
                                                                const std::string& field) {
  std::map<std::string, std::size_t> counts;
  for (const auto& r : records) {
    auto it = r.fields.find(field);
    counts[it == r.fields.end() ? "N/A" : it->second]++;
  }

  std::vector<std::pair<std::string, std::size_t>> out(counts.begin(), counts.end());
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
  return out;
}

std::string defaultStatsField(const std::vector<std::string>& fieldOrder) {
  for (const auto& name : fieldOrder) {
    if (toLower(name) == "level") return name;
  }
  return fieldOrder.empty() ? std::string() : fieldOrder.front();
}
