#include <catch2/catch.hpp>

#include "template.hpp"

#include <string>
#include <vector>

TEST_CASE("placeholder templates derive field names in first-seen order", "[template]") {
  CompiledTemplate t = compileTemplate("{Timestamp} {Level} {Message}", TemplateSyntax::Placeholder);

  REQUIRE(t.namedFields == std::vector<std::string>{"Timestamp", "Level", "Message"});
  REQUIRE(t.fields == t.namedFields);
  REQUIRE(t.catchAllField() == "Message");

  MatchOutcome m = matchLine(t, "2024-01-01 INFO started");
  REQUIRE(m.kind == MatchOutcome::Kind::Full);
  REQUIRE(m.populated == 3);
  REQUIRE(m.values.at("Timestamp") == "2024-01-01");
  REQUIRE(m.values.at("Level") == "INFO");
  REQUIRE(m.values.at("Message") == "started");
}

TEST_CASE("interior whitespace is matched fuzzily", "[template]") {
  CompiledTemplate t = compileTemplate("[{Timestamp}] {Level}: {Message}", TemplateSyntax::Placeholder);

  MatchOutcome m = matchLine(t, "[2025-10-23 09:00:00]    WARN:\tdisk   almost full");
  REQUIRE(m.kind == MatchOutcome::Kind::Full);
  REQUIRE(m.values.at("Timestamp") == "2025-10-23 09:00:00");
  REQUIRE(m.values.at("Level") == "WARN");
  REQUIRE(m.values.at("Message") == "disk   almost full");
}

TEST_CASE("matching is anchored at the start of the line", "[template]") {
  CompiledTemplate t = compileTemplate("id={Id} ok", TemplateSyntax::Placeholder);

  // Trailing content after the last literal is allowed.
  MatchOutcome trailing = matchLine(t, "id=42 ok and then some");
  REQUIRE(trailing.kind == MatchOutcome::Kind::Full);
  REQUIRE(trailing.values.at("Id") == "42");

  REQUIRE(matchLine(t, "prefix id=42 ok").kind == MatchOutcome::Kind::None);

  CompiledTemplate anchored = compileTemplate("(\\d+)$", TemplateSyntax::Regex, {"N"});
  REQUIRE(matchLine(anchored, "12").kind == MatchOutcome::Kind::Full);
  REQUIRE(matchLine(anchored, "12 abc").kind == MatchOutcome::Kind::None);
}

TEST_CASE("repeated placeholder names are deduplicated and must agree", "[template]") {
  CompiledTemplate t = compileTemplate("{A} {B} {A}", TemplateSyntax::Placeholder);

  REQUIRE(t.fields == std::vector<std::string>{"A", "B"});
  REQUIRE(matchLine(t, "x y x").kind == MatchOutcome::Kind::Full);
  REQUIRE(matchLine(t, "x y z").kind == MatchOutcome::Kind::None);
}

TEST_CASE("unnamed placeholders get synthetic names after the named ones", "[template]") {
  CompiledTemplate t = compileTemplate("{} {Level} {Message}", TemplateSyntax::Placeholder);

  REQUIRE(t.namedFields == std::vector<std::string>{"Level", "Message"});
  REQUIRE(t.fields == std::vector<std::string>{"Level", "Message", "unnamed_1"});
  REQUIRE(t.catchAllField() == "Message");

  MatchOutcome m = matchLine(t, "host01 ERROR broken pipe");
  REQUIRE(m.kind == MatchOutcome::Kind::Full);
  REQUIRE(m.values.at("unnamed_1") == "host01");
  REQUIRE(m.values.at("Level") == "ERROR");
  REQUIRE(m.values.at("Message") == "broken pipe");
}

TEST_CASE("doubled braces are literal braces", "[template]") {
  CompiledTemplate t = compileTemplate("{{{Key}}}", TemplateSyntax::Placeholder);
  MatchOutcome m = matchLine(t, "{abc}");
  REQUIRE(m.kind == MatchOutcome::Kind::Full);
  REQUIRE(m.values.at("Key") == "abc");
}

TEST_CASE("malformed placeholder templates are rejected", "[template][errors]") {
  REQUIRE_THROWS_AS(compileTemplate("{A", TemplateSyntax::Placeholder), TemplateError);
  REQUIRE_THROWS_AS(compileTemplate("A} {B}", TemplateSyntax::Placeholder), TemplateError);
  REQUIRE_THROWS_AS(compileTemplate("{1bad} {B}", TemplateSyntax::Placeholder), TemplateError);
  REQUIRE_THROWS_AS(compileTemplate("no fields here", TemplateSyntax::Placeholder), TemplateError);
  REQUIRE_THROWS_AS(compileTemplate("   ", TemplateSyntax::Placeholder), TemplateError);
}

TEST_CASE("regex templates validate the field count against capture groups", "[template][errors]") {
  CompiledTemplate t = compileTemplate("(\\w+) (\\w+)", TemplateSyntax::Regex, {"Key", "Value"});
  REQUIRE(t.fields == std::vector<std::string>{"Key", "Value"});

  REQUIRE_THROWS_AS(compileTemplate("(\\w+) (\\w+)", TemplateSyntax::Regex, {"Key"}), TemplateError);
  REQUIRE_THROWS_AS(compileTemplate("(\\w+) (\\w+)", TemplateSyntax::Regex, {"Key", "Key"}), TemplateError);
  REQUIRE_THROWS_AS(compileTemplate("\\w+", TemplateSyntax::Regex), TemplateError);

  CompiledTemplate unnamed = compileTemplate("(\\w+)=(\\w+)", TemplateSyntax::Regex);
  REQUIRE(unnamed.fields == std::vector<std::string>{"unnamed_1", "unnamed_2"});
}

TEST_CASE("invalid regex syntax is reported without escaping", "[template][errors]") {
  std::string error;
  auto t = tryCompileTemplate("([A-Z", TemplateSyntax::Regex, {"A"}, &error);

  REQUIRE_FALSE(t.has_value());
  REQUIRE(error.find("Invalid regular expression") != std::string::npos);
}

TEST_CASE("optional regex groups that do not participate give a partial match", "[template]") {
  CompiledTemplate t = compileTemplate("(\\w+)(?: (\\d+))?", TemplateSyntax::Regex, {"Word", "Num"});

  MatchOutcome both = matchLine(t, "hello 42");
  REQUIRE(both.kind == MatchOutcome::Kind::Full);

  MatchOutcome partial = matchLine(t, "hello");
  REQUIRE(partial.kind == MatchOutcome::Kind::Partial);
  REQUIRE(partial.populated == 1);
  REQUIRE(partial.values.at("Word") == "hello");
}

TEST_CASE("a match against a different expected field list is partial", "[template]") {
  CompiledTemplate t = compileTemplate("{A} {B}", TemplateSyntax::Placeholder);

  MatchOutcome m = matchLine(t, "one two", {"A", "C"});
  REQUIRE(m.kind == MatchOutcome::Kind::Partial);
  REQUIRE(m.populated == 1);
}

TEST_CASE("captures beyond the expected fields keep the match partial", "[template]") {
  CompiledTemplate t = compileTemplate("{Timestamp} {Level} {Message}", TemplateSyntax::Placeholder);

  MatchOutcome m = matchLine(t, "2024-01-01 INFO started", {"Timestamp", "Message"});
  REQUIRE(m.kind == MatchOutcome::Kind::Partial);
  REQUIRE(m.populated == 2);
  REQUIRE(m.values.at("Level") == "INFO");
}

TEST_CASE("format specs after a colon are accepted", "[template]") {
  CompiledTemplate t = compileTemplate("{Method} {Status:d} {Message}", TemplateSyntax::Placeholder);
  REQUIRE(t.fields == std::vector<std::string>{"Method", "Status", "Message"});

  MatchOutcome ok = matchLine(t, "GET 200 ok");
  REQUIRE(ok.kind == MatchOutcome::Kind::Full);
  REQUIRE(ok.values.at("Status") == "200");
  REQUIRE(ok.values.at("Message") == "ok");

  // "d" only takes digits.
  REQUIRE(matchLine(t, "GET abc ok").kind == MatchOutcome::Kind::None);

  CompiledTemplate generic = compileTemplate("{Timestamp:S} {:d} {Message}", TemplateSyntax::Placeholder);
  REQUIRE(generic.fields == std::vector<std::string>{"Timestamp", "Message", "unnamed_1"});
  MatchOutcome g = matchLine(generic, "09:00:00 42 done");
  REQUIRE(g.kind == MatchOutcome::Kind::Full);
  REQUIRE(g.values.at("Timestamp") == "09:00:00");
  REQUIRE(g.values.at("unnamed_1") == "42");

  REQUIRE_THROWS_AS(compileTemplate("{1bad:d} {B}", TemplateSyntax::Placeholder), TemplateError);
}

TEST_CASE("very long lines match without exhausting the stack", "[template][long]") {
  const std::string body(100000, 'x');

  CompiledTemplate t = compileTemplate("{Timestamp} {Level} {Message}", TemplateSyntax::Placeholder);
  MatchOutcome m = matchLine(t, "2024-01-01 INFO " + body);
  REQUIRE(m.kind == MatchOutcome::Kind::Full);
  REQUIRE(m.values.at("Message").size() == body.size());

  // The lazy first field has to scan the whole line before giving up.
  CompiledTemplate pair = compileTemplate("{A} {B}", TemplateSyntax::Placeholder);
  REQUIRE(matchLine(pair, body).kind == MatchOutcome::Kind::None);

  CompiledTemplate regex = compileTemplate("(\\w+) (.*)", TemplateSyntax::Regex, {"Key", "Rest"});
  MatchOutcome r = matchLine(regex, "key " + body);
  REQUIRE(r.kind == MatchOutcome::Kind::Full);
  REQUIRE(r.values.at("Rest").size() == body.size());
}

TEST_CASE("syntax detection distinguishes placeholders from regex quantifiers", "[template]") {
  REQUIRE(detectSyntax("{Timestamp} {Message}") == TemplateSyntax::Placeholder);
  REQUIRE(detectSyntax("{} {Message}") == TemplateSyntax::Placeholder);
  REQUIRE(detectSyntax("{Method} {Status:d}") == TemplateSyntax::Placeholder);
  REQUIRE(detectSyntax("{:d} rest") == TemplateSyntax::Placeholder);
  REQUIRE(detectSyntax("^(\\d{4}-\\d{2}-\\d{2}) (.*)$") == TemplateSyntax::Regex);
  REQUIRE(detectSyntax("(a{1,3})") == TemplateSyntax::Regex);
}
