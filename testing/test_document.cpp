#include <iostream>
#include <string>
#include "gridstore_client/document.hpp"

using namespace gridstore_client;

int test_count = 0;
int passed_count = 0;

void assert_test(bool condition, const std::string& test_name) {
    test_count++;
    if (condition) {
        std::cout << "✓ PASS: " << test_name << std::endl;
        passed_count++;
    } else {
        std::cout << "✗ FAIL: " << test_name << std::endl;
    }
}

// Test 1: Typed getters
void test_typed_getters() {
    Document doc;
    SetField(doc, "name", MakeString("report.txt"));
    SetField(doc, "payload", MakeBytes(std::string("a\0b", 3)));
    SetField(doc, "length", MakeInt(42));
    SetField(doc, "ratio", MakeDouble(2.0));

    assert_test(GetString(doc, "name").value_or("") == "report.txt",
                "Test 1.1: GetString returns stored string");
    assert_test(GetBytes(doc, "payload").value_or("") == std::string("a\0b", 3),
                "Test 1.2: GetBytes keeps embedded NUL bytes");
    assert_test(GetInt(doc, "length").value_or(-1) == 42,
                "Test 1.3: GetInt returns stored integer");
    assert_test(GetInt(doc, "ratio").value_or(-1) == 2,
                "Test 1.4: GetInt accepts integral double");
    assert_test(!GetString(doc, "length").has_value(),
                "Test 1.5: GetString on an int field is nullopt");
    assert_test(!GetInt(doc, "missing").has_value(),
                "Test 1.6: Missing field is nullopt");
    assert_test(HasField(doc, "name") && !HasField(doc, "missing"),
                "Test 1.7: HasField");
}

// Test 2: Nested documents
void test_nested_document() {
    Document inner;
    SetField(inner, "author", MakeString("kyle"));
    Document outer;
    SetField(outer, "metadata", MakeDocument(inner));

    auto got = GetDocument(outer, "metadata");
    assert_test(got.has_value(), "Test 2.1: GetDocument finds nested document");
    assert_test(got && GetString(*got, "author").value_or("") == "kyle",
                "Test 2.2: Nested field readable");

    Document empty;
    SetField(outer, "empty", MakeDocument(empty));
    auto got_empty = GetDocument(outer, "empty");
    assert_test(got_empty.has_value() && got_empty->fields().empty(),
                "Test 2.3: Empty nested document is present, not absent");
}

// Test 3: Value ordering
void test_compare_values() {
    assert_test(CompareValues(MakeInt(1), MakeInt(2)) < 0, "Test 3.1: 1 < 2");
    assert_test(CompareValues(MakeInt(3), MakeDouble(2.5)) > 0,
                "Test 3.2: Int and double compare numerically");
    assert_test(CompareValues(MakeInt(2), MakeDouble(2.0)) == 0,
                "Test 3.3: 2 == 2.0");
    assert_test(CompareValues(MakeString("abc"), MakeString("abd")) < 0,
                "Test 3.4: Strings compare lexicographically");
    assert_test(CompareValues(Value(), MakeInt(0)) < 0,
                "Test 3.5: Null orders before everything");
    assert_test(ValuesEqual(MakeString("x"), MakeString("x")), "Test 3.6: ValuesEqual");
    assert_test(!ValuesEqual(MakeString("1"), MakeInt(1)),
                "Test 3.7: Different kinds are not equal");
}

// Test 4: Filter matching
void test_matches() {
    Document doc;
    SetField(doc, "filename", MakeString("a.txt"));
    SetField(doc, "namespace", MakeString("fs"));
    SetField(doc, "n", MakeInt(0));

    Document filter;
    assert_test(Matches(doc, filter), "Test 4.1: Empty filter matches everything");

    SetField(filter, "filename", MakeString("a.txt"));
    SetField(filter, "namespace", MakeString("fs"));
    assert_test(Matches(doc, filter), "Test 4.2: All fields equal matches");

    SetField(filter, "namespace", MakeString("other"));
    assert_test(!Matches(doc, filter), "Test 4.3: One differing field fails");

    Document missing;
    SetField(missing, "md5", MakeString(""));
    assert_test(!Matches(doc, missing), "Test 4.4: Missing field fails");
}

// Test 5: Debug rendering
void test_debug_string() {
    Document doc;
    SetField(doc, "b", MakeInt(7));
    SetField(doc, "a", MakeString("x"));
    SetField(doc, "data", MakeBytes("1234"));
    assert_test(DebugString(doc) == "{a: \"x\", b: 7, data: <4 bytes>}",
                "Test 5.1: DebugString sorts keys and summarizes bytes");
}

int main() {
    std::cout << "=== Document Test Suite ===" << std::endl << std::endl;

    test_typed_getters();
    test_nested_document();
    test_compare_values();
    test_matches();
    test_debug_string();

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Passed: " << passed_count << " / " << test_count << std::endl;

    if (passed_count == test_count) {
        std::cout << "All tests passed! ✓" << std::endl;
        return 0;
    } else {
        std::cout << "Some tests failed! ✗" << std::endl;
        return 1;
    }
}
