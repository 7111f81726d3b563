#include "gridstore_client/chunk_store.hpp"
#include <iostream>
#include <vector>

namespace gridstore_client {

namespace {
constexpr const char* kFilesIdField = "files_id";
constexpr const char* kIndexField = "n";
constexpr const char* kDataField = "data";
}  // namespace

ChunkStore::ChunkStore(std::shared_ptr<Collection> chunks)
    : chunks_(std::move(chunks)) {}

Document ChunkStore::ChunkKey(const std::string& file_id, uint64_t index) {
    Document key;
    SetField(key, kFilesIdField, MakeString(file_id));
    SetField(key, kIndexField, MakeInt(static_cast<int64_t>(index)));
    return key;
}

grpc::Status ChunkStore::LoadChunk(const std::string& file_id, uint64_t index,
                                   std::string& out_payload) {
    Query query;
    *query.mutable_filter() = ChunkKey(file_id, index);
    query.set_limit(1);

    std::vector<Document> found;
    grpc::Status status = chunks_->Find(query, found);
    if (!status.ok()) {
        std::cerr << "ChunkStore: Failed to load chunk " << index << " of file "
                  << file_id << ": " << status.error_message() << std::endl;
        return status;
    }
    if (found.empty()) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "chunk " + std::to_string(index) + " of file " + file_id +
                            " not found");
    }

    auto data = GetBytes(found.front(), kDataField);
    if (!data) {
        return grpc::Status(grpc::StatusCode::DATA_LOSS,
                            "chunk " + std::to_string(index) + " of file " + file_id +
                            " has no data field");
    }
    out_payload = std::move(*data);
    return grpc::Status::OK;
}

grpc::Status ChunkStore::SaveChunk(const std::string& file_id, uint64_t index,
                                   const std::string& payload) {
    Document key = ChunkKey(file_id, index);
    Document chunk = key;
    SetField(chunk, kDataField, MakeBytes(payload));

    bool inserted = false;
    grpc::Status status = chunks_->Upsert(key, chunk, inserted);
    if (!status.ok()) {
        std::cerr << "ChunkStore: Failed to save chunk " << index << " of file "
                  << file_id << ": " << status.error_message() << std::endl;
        return status;
    }

    std::cout << "ChunkStore: " << (inserted ? "Inserted" : "Replaced") << " chunk "
              << index << " of file " << file_id << " (" << payload.size() << " bytes)"
              << std::endl;
    return grpc::Status::OK;
}

grpc::Status ChunkStore::DeleteChunks(const std::string& file_id) {
    Document filter;
    SetField(filter, kFilesIdField, MakeString(file_id));

    int64_t removed = 0;
    grpc::Status status = chunks_->Remove(filter, removed);
    if (status.ok() && removed > 0) {
        std::cout << "ChunkStore: Deleted " << removed << " chunk(s) of file " << file_id
                  << std::endl;
    }
    return status;
}

grpc::Status ChunkStore::DeleteChunksFrom(const std::string& file_id, uint64_t first_index,
                                          uint64_t end_index) {
    for (uint64_t index = first_index; index < end_index; ++index) {
        int64_t removed = 0;
        grpc::Status status = chunks_->Remove(ChunkKey(file_id, index), removed);
        if (!status.ok()) {
            return status;
        }
    }
    return grpc::Status::OK;
}

grpc::Status ChunkStore::CountChunks(const std::string& file_id, int64_t& out_count) {
    Document filter;
    SetField(filter, kFilesIdField, MakeString(file_id));
    return chunks_->Count(filter, out_count);
}

}  // namespace gridstore_client
