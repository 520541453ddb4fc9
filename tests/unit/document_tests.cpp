#include <doctest/doctest.h>
#include <sblint/document.hpp>

#include <string>
#include <vector>

using namespace sblint;

// ============================================================================
// Tests: parse_document
// ============================================================================

TEST_CASE("parse_document keeps source order") {
    auto result = parse_document(R"({"b": 1, "a": "x", "c": [true, null]})");
    REQUIRE(result.ok);

    const auto& entries = result.document.entries;
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].key == "b");
    CHECK(entries[0].value.as_integer() == 1);
    CHECK(entries[1].key == "a");
    CHECK(entries[1].value.as_string() == "x");
    CHECK(entries[2].key == "c");
    REQUIRE(entries[2].value.as_sequence().size() == 2);
    CHECK(entries[2].value.as_sequence()[0].as_boolean());
    CHECK(entries[2].value.as_sequence()[1].is_null());
}

TEST_CASE("parse_document keeps repeated top-level keys") {
    auto result = parse_document(R"({"pkg": "a", "pkg": "b"})");
    REQUIRE(result.ok);
    REQUIRE(result.document.entries.size() == 2);
    CHECK(result.document.entries[0].value.as_string() == "a");
    CHECK(result.document.entries[1].value.as_string() == "b");
}

TEST_CASE("parse_document keeps repeated nested keys") {
    auto result = parse_document(R"({"distro_pkg": {"fedora": ["a"], "fedora": ["b"]}})");
    REQUIRE(result.ok);
    const Value& distro = result.document.entries[0].value;
    REQUIRE(distro.is_mapping());
    CHECK(distro.as_mapping().size() == 2);
}

TEST_CASE("parse_document ignores comments") {
    const char* text = R"({
        // package name
        "pkg": "hello", /* trailing */
        "tag": ["cli"]
    })";
    auto result = parse_document(text);
    REQUIRE(result.ok);
    CHECK(result.document.entries.size() == 2);
    CHECK(result.document.source == text);
}

TEST_CASE("parse_document rejects non-object roots") {
    auto result = parse_document("[1, 2]");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("object") != std::string::npos);
}

TEST_CASE("parse_document reports syntax errors") {
    auto result = parse_document(R"({"pkg": )");
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("parse_document rejects deeply nested documents") {
    std::string deep = "{\"foobar\": " + std::string(200, '[') + std::string(200, ']') + "}";
    auto result = parse_document(deep);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("nested too deeply") != std::string::npos);

    std::string shallow = "{\"foobar\": " + std::string(100, '[') + std::string(100, ']') + "}";
    CHECK(parse_document(shallow).ok);
}

// ============================================================================
// Tests: KeyLocator
// ============================================================================

TEST_CASE("KeyLocator finds each occurrence of a top-level key") {
    const std::string text =
        "{\n"
        "  \"pkg\": \"a\",\n"
        "  \"x_exec\": {\"pkg\": \"nested\"},\n"
        "  \"description\": \"\\\"pkg\\\": not a key\",\n"
        "  \"pkg\": \"b\"\n"
        "}\n";
    KeyLocator locator(text);

    CHECK(locator.line_of("pkg") == 2);
    CHECK(locator.line_of("pkg", 1) == 5);
    CHECK(locator.line_of("x_exec") == 3);
    CHECK(locator.line_of("description") == 4);
    CHECK(locator.line_of("missing") == 0);
}

TEST_CASE("KeyLocator skips commented-out keys") {
    const std::string text =
        "{\n"
        "  // \"pkg\": \"old\",\n"
        "  /* \"pkg\":\n"
        "     \"older\" */\n"
        "  \"pkg\": \"new\"\n"
        "}\n";
    KeyLocator locator(text);
    CHECK(locator.line_of("pkg") == 5);
}

TEST_CASE("KeyLocator matches keys written with escapes") {
    const std::string text =
        "{\n"
        "  \"pkg\": \"a\",\n"
        "  \"\\u0070kg\": \"b\",\n"
        "  \"caf\\u00e9\": 1,\n"
        "  \"tab\\tkey\": 2\n"
        "}\n";
    KeyLocator locator(text);

    CHECK(locator.line_of("pkg") == 2);
    CHECK(locator.line_of("pkg", 1) == 3);
    CHECK(locator.line_of("caf\xc3\xa9") == 4);
    CHECK(locator.line_of("tab\tkey") == 5);

    auto parsed = parse_document(text);
    REQUIRE(parsed.ok);
    CHECK(parsed.document.entries[1].key == "pkg");
    CHECK(parsed.document.entries[2].key == "caf\xc3\xa9");
}

// ============================================================================
// Tests: JSON output
// ============================================================================

TEST_CASE("to_json writes validated fields in order") {
    Value x_exec = Value::mapping();
    x_exec.add_entry("shell", Value::string("sh"));
    x_exec.add_entry("shell", Value::string("bash"));

    std::vector<Value::Entry> fields = {
        {"pkg", Value::string("hello")},
        {"_disabled", Value::boolean(false)},
        {"x_exec", x_exec},
    };
    ValidatedConfig config(fields);

    auto j = to_json(config);
    auto it = j.begin();
    CHECK(it.key() == "pkg");
    ++it;
    CHECK(it.key() == "_disabled");
    CHECK(j["x_exec"]["shell"] == "sh");
    CHECK(j["_disabled"] == false);
}

TEST_CASE("ValidatedConfig lookup") {
    std::vector<Value::Entry> fields = {{"pkg", Value::string("hello")}};
    ValidatedConfig config(fields);
    CHECK(config.contains("pkg"));
    CHECK_FALSE(config.contains("pkg_id"));
    CHECK(config.size() == 1);
    CHECK(ValidatedConfig().empty());
}
