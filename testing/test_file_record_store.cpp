#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "gridstore_client/file_record_store.hpp"
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

FileRecord MakeRecord(const std::string& name, int64_t version, int64_t upload_date_ms) {
    FileRecord record;
    record.name = name;
    record.version = version;
    record.upload_date_ms = upload_date_ms;
    return record;
}

// Test 1: Document round trip keeps optional metadata distinct
void test_record_document() {
    FileRecord record = MakeRecord("a.txt", 3, 1000);
    record.id = "id-1";
    record.length = 12;
    record.chunk_size = 512;
    record.md5 = "abc";

    FileRecord parsed;
    grpc::Status status = FileRecord::FromDocument(record.ToDocument(), parsed);
    assert_test(status.ok(), "Test 1.1: FromDocument accepts ToDocument output");
    assert_test(parsed.name == "a.txt" && parsed.length == 12 && parsed.chunk_size == 512 &&
                parsed.version == 3 && parsed.upload_date_ms == 1000 && parsed.md5 == "abc",
                "Test 1.2: Fields survive");
    assert_test(parsed.content_type == kDefaultContentType && parsed.root == kDefaultRoot,
                "Test 1.3: Defaults survive");
    assert_test(!parsed.metadata.has_value(), "Test 1.4: Absent metadata stays absent");

    record.metadata = Document();
    FileRecord::FromDocument(record.ToDocument(), parsed);
    assert_test(parsed.metadata.has_value() && parsed.metadata->fields().empty(),
                "Test 1.5: Empty metadata stays present");

    Document broken = record.ToDocument();
    broken.mutable_fields()->erase("length");
    status = FileRecord::FromDocument(broken, parsed);
    assert_test(status.error_code() == grpc::StatusCode::DATA_LOSS,
                "Test 1.6: Missing length is DATA_LOSS");
}

// Test 2: Latest record wins by version, then upload date, then id
void test_find_latest() {
    auto files = std::make_shared<MemoryCollection>("fs.files");
    FileRecordStore store(files, "fs");

    FileRecord missing;
    grpc::Status status = store.FindLatestByName("a.txt", missing);
    assert_test(status.error_code() == grpc::StatusCode::NOT_FOUND,
                "Test 2.1: Unknown name is NOT_FOUND");

    FileRecord v1 = MakeRecord("a.txt", 1, 5000);
    FileRecord v2 = MakeRecord("a.txt", 2, 1000);
    store.Insert(v2);
    store.Insert(v1);

    FileRecord latest;
    store.FindLatestByName("a.txt", latest);
    assert_test(latest.id == v2.id, "Test 2.2: Higher version wins over later upload date");

    FileRecord same_a = MakeRecord("b.txt", 1, 1000);
    same_a.id = "aaa";
    FileRecord same_b = MakeRecord("b.txt", 1, 1000);
    same_b.id = "bbb";
    store.Insert(same_b);
    store.Insert(same_a);
    store.FindLatestByName("b.txt", latest);
    assert_test(latest.id == "bbb", "Test 2.3: Full tie broken by highest id");

    std::vector<FileRecord> all;
    store.FindAllByName("a.txt", all);
    assert_test(all.size() == 2 && all[0].version == 2 && all[1].version == 1,
                "Test 2.4: FindAllByName is most recent first");

    int64_t next = 0;
    store.NextVersion("a.txt", next);
    assert_test(next == 3, "Test 2.5: NextVersion follows the latest");
    store.NextVersion("new.txt", next);
    assert_test(next == 1, "Test 2.6: NextVersion of unknown name is 1");
}

// Test 3: Update, FindById, Delete, Exists, ListNames
void test_update_delete() {
    auto files = std::make_shared<MemoryCollection>("fs.files");
    FileRecordStore store(files, "fs");

    FileRecord record = MakeRecord("a.txt", 1, 1000);
    store.Insert(record);
    assert_test(!record.id.empty(), "Test 3.1: Insert assigns an id");

    record.length = 99;
    grpc::Status status = store.Update(record);
    FileRecord found;
    store.FindById(record.id, found);
    assert_test(status.ok() && found.length == 99, "Test 3.2: Update replaces by id");

    int64_t count = 0;
    files->Count(Document(), count);
    assert_test(count == 1, "Test 3.3: Update does not add a record");

    FileRecord ghost = MakeRecord("ghost", 1, 0);
    ghost.id = "no-such-id";
    status = store.Update(ghost);
    assert_test(status.error_code() == grpc::StatusCode::NOT_FOUND,
                "Test 3.4: Update of unknown id is NOT_FOUND");

    FileRecord other = MakeRecord("b.txt", 1, 1000);
    store.Insert(other);
    FileRecord again = MakeRecord("a.txt", 2, 2000);
    store.Insert(again);

    std::vector<std::string> names;
    store.ListNames(names);
    assert_test(names == std::vector<std::string>({"a.txt", "b.txt"}),
                "Test 3.5: ListNames is distinct and sorted");

    int64_t removed = 0;
    store.DeleteByName("a.txt", removed);
    bool exists = true;
    store.Exists("a.txt", exists);
    assert_test(removed == 2 && !exists, "Test 3.6: DeleteByName removes every version");

    store.Exists("b.txt", exists);
    assert_test(exists, "Test 3.7: Other names kept");
}

// Test 4: Roots sharing one collection stay separate
void test_root_isolation() {
    auto files = std::make_shared<MemoryCollection>("shared.files");
    FileRecordStore fs_store(files, "fs");
    FileRecordStore img_store(files, "img");

    FileRecord record = MakeRecord("a.txt", 1, 0);
    fs_store.Insert(record);

    bool in_fs = false;
    bool in_img = true;
    fs_store.Exists("a.txt", in_fs);
    img_store.Exists("a.txt", in_img);
    assert_test(in_fs && !in_img, "Test 4.1: Name found only in its own root");

    std::vector<std::string> names;
    img_store.ListNames(names);
    assert_test(names.empty(), "Test 4.2: ListNames is scoped to the root");
}

int main() {
    std::cout << "=== File Record Store Test Suite ===" << std::endl << std::endl;

    test_record_document();
    test_find_latest();
    test_update_delete();
    test_root_isolation();

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
