#include <doctest/doctest.h>
#include <sblint/distro_pkg.hpp>

using namespace sblint;

namespace {

Value names(std::initializer_list<const char*> items) {
    Value seq = Value::sequence();
    for (const char* item : items) {
        seq.push_back(Value::string(item));
    }
    return seq;
}

} // namespace

TEST_CASE("DistroPkg::from_value builds lists and nested nodes") {
    Value release = Value::mapping();
    release.add_entry("41", names({"hello"}));
    Value root = Value::mapping();
    root.add_entry("fedora", release);
    root.add_entry("debian", names({"hello-bin", "hello-data"}));

    auto pkg = DistroPkg::from_value(root);
    REQUIRE(pkg);
    REQUIRE_FALSE(pkg->is_list());
    REQUIRE(pkg->children().size() == 2);
    CHECK(pkg->children()[0].key == "fedora");
    CHECK_FALSE(pkg->children()[0].value.is_list());
    CHECK(pkg->children()[1].value.list().size() == 2);

    CHECK_FALSE(DistroPkg::from_value(Value::string("hello")));
    CHECK_FALSE(DistroPkg::from_value(Value::sequence({Value::integer(1)})));
}

TEST_CASE("check_duplicate_values reports repeated entries") {
    DiagnosticStore sink;
    DuplicateChecker checker(sink);
    checker.check_duplicate_values({"a", "b", "a"}, "tag", 7);

    const Diagnostic* d = sink.find("tag");
    REQUIRE(d != nullptr);
    CHECK(d->message == "Duplicate value 'a' found in tag");
    CHECK(d->severity == Severity::Error);
    CHECK(d->line == 7);

    DiagnosticStore clean;
    DuplicateChecker(clean).check_duplicate_values({"a", "b"}, "tag", 7);
    CHECK(clean.empty());
}

TEST_CASE("check_distro_pkg_duplicates reports a repeated key and skips it") {
    // distro_pkg: {fedora: {fedora: [...]}, fedora: {fedora: [x, x]}}
    Value inner = Value::mapping();
    inner.add_entry("fedora", names({"hello"}));
    Value repeated = Value::mapping();
    repeated.add_entry("fedora", names({"x", "x"}));

    Value root = Value::mapping();
    root.add_entry("fedora", inner);
    root.add_entry("fedora", repeated);

    auto pkg = DistroPkg::from_value(root);
    REQUIRE(pkg);

    DiagnosticStore sink;
    DuplicateChecker checker(sink);
    checker.check_distro_pkg_duplicates(*pkg, "distro_pkg", 9);

    REQUIRE(sink.size() == 1);
    CHECK(sink.diagnostics()[0].field == "distro_pkg.fedora");
    CHECK(sink.diagnostics()[0].message == "'distro_pkg.fedora' field is duplicated");
    CHECK(sink.diagnostics()[0].severity == Severity::Error);
}

TEST_CASE("check_distro_pkg_duplicates distinguishes paths by depth") {
    Value inner = Value::mapping();
    inner.add_entry("fedora", names({"hello"}));
    inner.add_entry("fedora", names({"hello"}));
    Value root = Value::mapping();
    root.add_entry("fedora", inner);

    auto pkg = DistroPkg::from_value(root);
    REQUIRE(pkg);

    DiagnosticStore sink;
    DuplicateChecker(sink).check_distro_pkg_duplicates(*pkg, "distro_pkg", 4);

    REQUIRE(sink.size() == 1);
    CHECK(sink.diagnostics()[0].field == "distro_pkg.fedora.fedora");
}

TEST_CASE("check_distro_pkg_duplicates checks leaf lists") {
    Value root = Value::mapping();
    root.add_entry("arch", names({"hello", "hello"}));

    auto pkg = DistroPkg::from_value(root);
    REQUIRE(pkg);

    DiagnosticStore sink;
    DuplicateChecker(sink).check_distro_pkg_duplicates(*pkg, "", 2);

    const Diagnostic* d = sink.find("arch");
    REQUIRE(d != nullptr);
    CHECK(d->message == "Duplicate value 'hello' found in arch");
}
