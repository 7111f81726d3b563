#include <iostream>
#include <memory>
#include <string>
#include "gridstore_client/chunk_store.hpp"
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

// Test 1: Save then load
void test_save_load() {
    auto coll = std::make_shared<MemoryCollection>("fs.chunks");
    ChunkStore store(coll);

    grpc::Status status = store.SaveChunk("file-1", 0, "hello");
    assert_test(status.ok(), "Test 1.1: SaveChunk should succeed");

    std::string payload;
    status = store.LoadChunk("file-1", 0, payload);
    assert_test(status.ok() && payload == "hello", "Test 1.2: LoadChunk returns payload");

    status = store.LoadChunk("file-1", 1, payload);
    assert_test(status.error_code() == grpc::StatusCode::NOT_FOUND,
                "Test 1.3: Missing chunk index is NOT_FOUND");
    status = store.LoadChunk("file-2", 0, payload);
    assert_test(status.error_code() == grpc::StatusCode::NOT_FOUND,
                "Test 1.4: Other file's chunk is NOT_FOUND");
}

// Test 2: Save replaces in place
void test_save_replaces() {
    auto coll = std::make_shared<MemoryCollection>("fs.chunks");
    ChunkStore store(coll);

    store.SaveChunk("file-1", 0, "first");
    store.SaveChunk("file-1", 0, "second");

    int64_t count = 0;
    store.CountChunks("file-1", count);
    assert_test(count == 1, "Test 2.1: Saving the same index twice keeps one chunk");

    std::string payload;
    store.LoadChunk("file-1", 0, payload);
    assert_test(payload == "second", "Test 2.2: Latest payload wins");

    std::vector<Document> all = coll->Snapshot();
    assert_test(all.size() == 1 && GetString(all[0], "files_id").value_or("") == "file-1" &&
                GetInt(all[0], "n").value_or(-1) == 0 &&
                GetBytes(all[0], "data").value_or("") == "second",
                "Test 2.3: Stored layout is {files_id, n, data}");
}

// Test 3: Delete all and ranges
void test_delete() {
    auto coll = std::make_shared<MemoryCollection>("fs.chunks");
    ChunkStore store(coll);

    for (uint64_t i = 0; i < 5; ++i) {
        store.SaveChunk("file-1", i, std::string(4, static_cast<char>('a' + i)));
    }
    store.SaveChunk("file-2", 0, "keep");

    grpc::Status status = store.DeleteChunksFrom("file-1", 2, 5);
    int64_t count = 0;
    store.CountChunks("file-1", count);
    assert_test(status.ok() && count == 2, "Test 3.1: DeleteChunksFrom removes [2, 5)");

    std::string payload;
    store.LoadChunk("file-1", 1, payload);
    assert_test(payload == "bbbb", "Test 3.2: Chunks below the range are kept");

    status = store.DeleteChunks("file-1");
    store.CountChunks("file-1", count);
    assert_test(status.ok() && count == 0, "Test 3.3: DeleteChunks removes every chunk");

    status = store.DeleteChunks("file-1");
    assert_test(status.ok(), "Test 3.4: DeleteChunks on nothing is not an error");

    store.CountChunks("file-2", count);
    assert_test(count == 1, "Test 3.5: Other files untouched");
}

// Test 4: Chunk without payload
void test_missing_data_field() {
    auto coll = std::make_shared<MemoryCollection>("fs.chunks");
    ChunkStore store(coll);

    Document broken;
    SetField(broken, "files_id", MakeString("file-1"));
    SetField(broken, "n", MakeInt(0));
    std::string id;
    coll->Insert(broken, id);

    std::string payload;
    grpc::Status status = store.LoadChunk("file-1", 0, payload);
    assert_test(status.error_code() == grpc::StatusCode::DATA_LOSS,
                "Test 4.1: Chunk without data is DATA_LOSS");
}

int main() {
    std::cout << "=== Chunk Store Test Suite ===" << std::endl << std::endl;

    test_save_load();
    test_save_replaces();
    test_delete();
    test_missing_data_field();

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
