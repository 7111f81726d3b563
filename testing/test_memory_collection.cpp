#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "gridstore_client/memory_collection.hpp"

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

Document MakeDoc(const std::string& name, int64_t n) {
    Document doc;
    SetField(doc, "name", MakeString(name));
    SetField(doc, "n", MakeInt(n));
    return doc;
}

Document NameFilter(const std::string& name) {
    Document filter;
    SetField(filter, "name", MakeString(name));
    return filter;
}

// Test 1: Insert assigns ids
void test_insert_assigns_id() {
    MemoryCollection coll("fs.files");
    std::string id;
    grpc::Status status = coll.Insert(MakeDoc("a", 1), id);
    assert_test(status.ok(), "Test 1.1: Insert should succeed");
    assert_test(id.size() == 36, "Test 1.2: Assigned id is a UUID string");

    Document with_id = MakeDoc("b", 2);
    SetField(with_id, kIdField, MakeString("fixed-id"));
    std::string kept;
    coll.Insert(with_id, kept);
    assert_test(kept == "fixed-id", "Test 1.3: Caller-provided _id is kept");

    std::string other;
    coll.Insert(MakeDoc("c", 3), other);
    assert_test(other != id, "Test 1.4: Generated ids are unique");
    assert_test(coll.name() == "fs.files", "Test 1.5: Collection keeps its name");
}

// Test 2: Find with filter, sort and limit
void test_find_sort_limit() {
    MemoryCollection coll("c");
    std::string id;
    coll.Insert(MakeDoc("x", 2), id);
    coll.Insert(MakeDoc("x", 5), id);
    coll.Insert(MakeDoc("y", 9), id);
    coll.Insert(MakeDoc("x", 1), id);

    Query query;
    *query.mutable_filter() = NameFilter("x");
    std::vector<Document> found;
    coll.Find(query, found);
    assert_test(found.size() == 3, "Test 2.1: Filter selects matching documents");
    assert_test(GetInt(found[0], "n").value_or(0) == 2,
                "Test 2.2: Unsorted find keeps insertion order");

    auto* sort = query.add_sort();
    sort->set_field("n");
    sort->set_descending(true);
    coll.Find(query, found);
    assert_test(found.size() == 3 && GetInt(found[0], "n").value_or(0) == 5 &&
                GetInt(found[2], "n").value_or(0) == 1,
                "Test 2.3: Descending sort orders by n");

    query.set_limit(1);
    coll.Find(query, found);
    assert_test(found.size() == 1 && GetInt(found[0], "n").value_or(0) == 5,
                "Test 2.4: Limit applies after sort");
}

// Test 3: Upsert replaces or inserts
void test_upsert() {
    MemoryCollection coll("c");
    std::string id;
    coll.Insert(MakeDoc("a", 1), id);

    bool inserted = true;
    grpc::Status status = coll.Upsert(NameFilter("a"), MakeDoc("a", 10), inserted);
    assert_test(status.ok() && !inserted, "Test 3.1: Upsert on match replaces");

    Query query;
    *query.mutable_filter() = NameFilter("a");
    std::vector<Document> found;
    coll.Find(query, found);
    assert_test(found.size() == 1 && GetInt(found[0], "n").value_or(0) == 10,
                "Test 3.2: Replacement content visible");
    assert_test(GetString(found[0], kIdField).value_or("") == id,
                "Test 3.3: Replacement keeps matched _id");

    coll.Upsert(NameFilter("b"), MakeDoc("b", 20), inserted);
    int64_t count = 0;
    coll.Count(Document(), count);
    assert_test(inserted && count == 2, "Test 3.4: Upsert without match inserts");
}

// Test 4: Remove and Count
void test_remove_count() {
    MemoryCollection coll("c");
    std::string id;
    coll.Insert(MakeDoc("a", 1), id);
    coll.Insert(MakeDoc("a", 2), id);
    coll.Insert(MakeDoc("b", 3), id);

    int64_t count = 0;
    coll.Count(NameFilter("a"), count);
    assert_test(count == 2, "Test 4.1: Count by filter");

    int64_t removed = 0;
    coll.Remove(NameFilter("a"), removed);
    assert_test(removed == 2, "Test 4.2: Remove reports removed count");

    coll.Remove(NameFilter("a"), removed);
    assert_test(removed == 0, "Test 4.3: Removing nothing is not an error");

    coll.Count(Document(), count);
    assert_test(count == 1, "Test 4.4: Other documents untouched");
}

// Test 5: Backend administration
void test_backend_admin() {
    MemoryBackend backend;

    ServerInfo info;
    backend.GetServerInfo(info);
    assert_test(info.version == MemoryBackend::kVersion && info.ok == 1.0,
                "Test 5.1: Server info reports version and ok");

    auto a = backend.GetCollection("db1", "items");
    auto b = backend.GetCollection("db1", "items");
    assert_test(a == b, "Test 5.2: Same names give the same collection");

    std::map<std::string, int64_t> sizes;
    backend.ListDatabases(sizes);
    assert_test(sizes.empty(), "Test 5.3: Databases with no documents are not listed");

    std::string id;
    a->Insert(MakeDoc("a", 1), id);
    backend.ListDatabases(sizes);
    assert_test(sizes.count("db1") == 1 && sizes["db1"] > 0,
                "Test 5.4: Database with documents is listed with a size");

    grpc::Status status = backend.CopyDatabase("db1", "db2");
    assert_test(status.ok(), "Test 5.5: CopyDatabase succeeds");
    int64_t count = 0;
    backend.GetCollection("db2", "items")->Count(Document(), count);
    assert_test(count == 1, "Test 5.6: Copied database holds the documents");

    a->Insert(MakeDoc("b", 2), id);
    backend.GetCollection("db2", "items")->Count(Document(), count);
    assert_test(count == 1, "Test 5.7: Copy is independent of the source");

    status = backend.CopyDatabase("db1", "db1");
    assert_test(status.error_code() == grpc::StatusCode::INVALID_ARGUMENT,
                "Test 5.8: Copy onto itself is INVALID_ARGUMENT");
    status = backend.CopyDatabase("nope", "db3");
    assert_test(status.error_code() == grpc::StatusCode::NOT_FOUND,
                "Test 5.9: Copy of missing database is NOT_FOUND");

    backend.DropDatabase("db1");
    backend.ListDatabases(sizes);
    assert_test(sizes.count("db1") == 0 && sizes.count("db2") == 1,
                "Test 5.10: DropDatabase removes only that database");
}

int main() {
    std::cout << "=== Memory Collection Test Suite ===" << std::endl << std::endl;

    test_insert_assigns_id();
    test_find_sort_limit();
    test_upsert();
    test_remove_count();
    test_backend_admin();

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
