#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// Number of non-empty lines sampled from a file when suggesting a template.
constexpr std::size_t kSuggestionSampleSize = 5;

// Raised when an input file cannot be opened for reading.
class FileNotFoundError : public std::runtime_error {
public:
  explicit FileNotFoundError(const std::string& path);
};

std::string trim(const std::string& s);

// Calls `fn` with each trimmed, non-empty line of the file, in order, until `fn`
// returns false or the file is exhausted. The file is closed before returning.
// Throws FileNotFoundError if the file cannot be opened.
void forEachNonEmptyLine(const std::string& path, const std::function<bool(const std::string&)>& fn);

// Reads trimmed, non-empty lines from a file in order and stops after `limit`
// lines (0 reads the whole file). Throws FileNotFoundError if the file cannot be opened.
std::vector<std::string> readNonEmptyLines(const std::string& path, std::size_t limit = 0);
