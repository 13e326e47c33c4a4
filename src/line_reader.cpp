#include "line_reader.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>

FileNotFoundError::FileNotFoundError(const std::string& path)
  : std::runtime_error("Error: The file was not found at path: " + path) {}

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

namespace {

void scanLines(std::istream& in, const std::function<bool(const std::string&)>& fn) {
  std::string raw;
  while (std::getline(in, raw)) {
    std::string line = trim(raw);
    if (line.empty()) continue;
    if (!fn(line)) break;
  }
}

} // namespace

void forEachNonEmptyLine(const std::string& path, const std::function<bool(const std::string&)>& fn) {
  std::ifstream in(path);
  if (!in || std::filesystem::is_directory(path)) {
    throw FileNotFoundError(path);
  }
  scanLines(in, fn);
}

std::vector<std::string> readNonEmptyLines(const std::string& path, std::size_t limit) {
  std::vector<std::string> lines;
  forEachNonEmptyLine(path, [&](const std::string& line) {
    lines.push_back(line);
    return limit == 0 || lines.size() < limit;
  });
  return lines;
}
