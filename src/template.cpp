#include "template.hpp"
#include "line_reader.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

struct Token {
  bool isField = false;
  std::string text; // literal text, or field name ("" for an unnamed field)
  std::string spec; // format spec after ':' in "{Name:spec}"
};

bool isIdentifier(const std::string& s) {
  if (s.empty()) return false;
  if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
  return std::all_of(s.begin(), s.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

std::vector<Token> tokenizePlaceholders(const std::string& pattern) {
  std::vector<Token> tokens;
  std::string literal;
  auto flushLiteral = [&]() {
    if (!literal.empty()) {
      tokens.push_back(Token{false, literal});
      literal.clear();
    }
  };

  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '{') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
        literal.push_back('{');
        ++i;
        continue;
      }
      size_t close = pattern.find('}', i + 1);
      if (close == std::string::npos) {
        throw TemplateError("Invalid template: unterminated '{' at position " + std::to_string(i));
      }
      std::string name = pattern.substr(i + 1, close - i - 1);
      std::string spec;
      size_t colon = name.find(':');
      if (colon != std::string::npos) {
        spec = name.substr(colon + 1);
        name.erase(colon);
      }
      if (!name.empty() && !isIdentifier(name)) {
        throw TemplateError("Invalid template: bad field name '" + name + "' at position " + std::to_string(i));
      }
      flushLiteral();
      tokens.push_back(Token{true, name, spec});
      i = close;
    } else if (c == '}') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '}') {
        literal.push_back('}');
        ++i;
        continue;
      }
      throw TemplateError("Invalid template: single '}' at position " + std::to_string(i));
    } else {
      literal.push_back(c);
    }
  }
  flushLiteral();
  return tokens;
}

// Escapes regex metacharacters; whitespace runs become \s+.
std::string literalToRegex(const std::string& literal) {
  static const std::string special = ".^$|()[]{}*+?\\";
  std::string out;
  bool inSpace = false;
  for (char c : literal) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!inSpace) out += "\\s+";
      inSpace = true;
      continue;
    }
    inSpace = false;
    if (special.find(c) != std::string::npos) out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

std::string unnamedFieldName(size_t index, const std::vector<std::string>& taken) {
  std::string name = "unnamed_" + std::to_string(index);
  while (std::find(taken.begin(), taken.end(), name) != taken.end()) name += "_";
  return name;
}

// Capture group for a placeholder field. "d" and "w" narrow the field to digits or
// word characters; any other spec matches like a plain field.
std::string fieldGroup(const std::string& spec, bool trailing) {
  if (spec == "d") return "(\\d+)";
  if (spec == "w") return "(\\w+)";
  return trailing ? "(.+)" : "(.+?)";
}

boost::regex buildRegex(const std::string& source) {
  try {
    return boost::regex(source, boost::regex::perl);
  } catch (const boost::regex_error& e) {
    throw TemplateError(std::string("Invalid regular expression: ") + e.what());
  }
}

void compilePlaceholder(CompiledTemplate& t) {
  std::vector<Token> tokens = tokenizePlaceholders(trim(t.pattern));

  std::string source;
  std::unordered_map<std::string, size_t> groupOf;
  std::vector<size_t> unnamedGroups;
  size_t nextGroup = 1;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token& tok = tokens[i];
    if (!tok.isField) {
      source += literalToRegex(tok.text);
      continue;
    }
    auto seen = groupOf.find(tok.text);
    if (!tok.text.empty() && seen != groupOf.end()) {
      source += "\\" + std::to_string(seen->second);
      continue;
    }
    // A trailing field takes the remainder of the line.
    source += fieldGroup(tok.spec, i + 1 == tokens.size());
    if (tok.text.empty()) {
      unnamedGroups.push_back(nextGroup);
    } else {
      groupOf[tok.text] = nextGroup;
      t.namedFields.push_back(tok.text);
    }
    ++nextGroup;
  }

  if (t.namedFields.empty() && unnamedGroups.empty()) {
    throw TemplateError("Invalid template: '" + t.pattern + "' declares no fields");
  }

  for (const auto& name : t.namedFields) {
    t.fields.push_back(name);
    t.groups.push_back(groupOf[name]);
  }
  for (size_t k = 0; k < unnamedGroups.size(); ++k) {
    t.fields.push_back(unnamedFieldName(k + 1, t.namedFields));
    t.groups.push_back(unnamedGroups[k]);
  }

  t.matcher = buildRegex(source);
}

void compileRegex(CompiledTemplate& t, const std::vector<std::string>& fieldNames) {
  t.matcher = buildRegex(t.pattern);
  const size_t groupCount = t.matcher.mark_count();
  if (groupCount == 0) {
    throw TemplateError("Invalid template: regular expression has no capture groups");
  }

  if (fieldNames.empty()) {
    for (size_t g = 1; g <= groupCount; ++g) {
      t.fields.push_back(unnamedFieldName(g, {}));
      t.groups.push_back(g);
    }
    return;
  }

  if (fieldNames.size() != groupCount) {
    throw TemplateError("Field name count (" + std::to_string(fieldNames.size()) +
                        ") does not match capture group count (" + std::to_string(groupCount) + ")");
  }
  for (size_t i = 0; i < fieldNames.size(); ++i) {
    const std::string& name = fieldNames[i];
    if (name.empty()) {
      throw TemplateError("Field names must not be empty");
    }
    if (std::find(fieldNames.begin(), fieldNames.begin() + i, name) != fieldNames.begin() + i) {
      throw TemplateError("Duplicate field name: " + name);
    }
    t.namedFields.push_back(name);
    t.fields.push_back(name);
    t.groups.push_back(i + 1);
  }
}

} // namespace

const std::string& CompiledTemplate::catchAllField() const {
  return namedFields.empty() ? fields.back() : namedFields.back();
}

TemplateSyntax detectSyntax(const std::string& pattern) {
  static const boost::regex placeholder("\\{([A-Za-z_][A-Za-z0-9_]*)?(:[^{}]*)?\\}");
  return boost::regex_search(pattern, placeholder) ? TemplateSyntax::Placeholder : TemplateSyntax::Regex;
}

CompiledTemplate compileTemplate(const std::string& pattern,
                                 TemplateSyntax syntax,
                                 const std::vector<std::string>& fieldNames) {
  if (trim(pattern).empty()) {
    throw TemplateError("Invalid template: pattern is empty");
  }

  CompiledTemplate t;
  t.pattern = pattern;
  t.syntax = syntax;
  if (syntax == TemplateSyntax::Placeholder) {
    compilePlaceholder(t);
  } else {
    compileRegex(t, fieldNames);
  }
  return t;
}

std::optional<CompiledTemplate> tryCompileTemplate(const std::string& pattern,
                                                   TemplateSyntax syntax,
                                                   const std::vector<std::string>& fieldNames,
                                                   std::string* error) {
  try {
    return compileTemplate(pattern, syntax, fieldNames);
  } catch (const TemplateError& e) {
    if (error) *error = e.what();
    return std::nullopt;
  }
}

MatchOutcome matchLine(const CompiledTemplate& tmpl, const std::string& line) {
  return matchLine(tmpl, line, tmpl.fields);
}

MatchOutcome matchLine(const CompiledTemplate& tmpl,
                       const std::string& line,
                       const std::vector<std::string>& expectedFields) {
  MatchOutcome outcome;
  boost::smatch m;
  try {
    if (!boost::regex_search(line, m, tmpl.matcher, boost::match_continuous)) {
      return outcome;
    }
  } catch (const std::runtime_error&) {
    // Boost gives up on runaway backtracking or exhausted match memory: the line does not match.
    return outcome;
  }

  for (size_t i = 0; i < tmpl.fields.size(); ++i) {
    const auto& sub = m[tmpl.groups[i]];
    if (sub.matched) outcome.values[tmpl.fields[i]] = trim(sub.str());
  }
  for (const auto& name : expectedFields) {
    if (outcome.values.count(name)) outcome.populated++;
  }
  outcome.kind = (outcome.populated == expectedFields.size() && outcome.values.size() == expectedFields.size())
    ? MatchOutcome::Kind::Full
    : MatchOutcome::Kind::Partial;
  return outcome;
}
