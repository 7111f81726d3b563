#pragma once

#include "gridstore_client/collection.hpp"
#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gridstore_client {

// ============================================================================
// GridFS Defaults
// ============================================================================
constexpr const char* kDefaultRoot = "fs";
constexpr uint64_t kDefaultChunkSize = 256 * 1024;  // 256 KB chunks
constexpr const char* kDefaultContentType = "text/plain";

/**
 * FileRecord: Metadata of one stored file version
 *
 * Several records may share (name, root); the one with the highest
 * version is the current file. Ties fall back to upload_date_ms, then id.
 */
struct FileRecord {
    std::string id;
    std::string name;
    std::string root = kDefaultRoot;
    uint64_t length = 0;
    uint64_t chunk_size = kDefaultChunkSize;
    int64_t upload_date_ms = 0;         // ms since Unix epoch
    std::string content_type = kDefaultContentType;
    std::optional<Document> metadata;   // absent != empty
    std::string md5;                    // hex digest of content
    int64_t version = 1;

    Document ToDocument() const;

    /**
     * @return DATA_LOSS when a required field is missing or mistyped
     */
    static grpc::Status FromDocument(const Document& doc, FileRecord& out_record);
};

/**
 * FileRecordStore: File records of one root in "<root>.files"
 *
 * Document layout:
 *   { _id, filename, namespace, length, chunkSize, uploadDate,
 *     contentType, metadata?, md5, version }
 */
class FileRecordStore {
public:
    FileRecordStore(std::shared_ptr<Collection> files, const std::string& root);

    /**
     * Most recent record for name.
     * @return NOT_FOUND when no record carries that name in this root
     */
    grpc::Status FindLatestByName(const std::string& name, FileRecord& out_record);

    // Every record for name, most recent first
    grpc::Status FindAllByName(const std::string& name, std::vector<FileRecord>& out_records);

    grpc::Status FindById(const std::string& id, FileRecord& out_record);

    // Assigns record.id from IdGenerator when empty
    grpc::Status Insert(FileRecord& record);

    // Full replace by id. NOT_FOUND when no record has that id.
    grpc::Status Update(const FileRecord& record);

    grpc::Status DeleteByName(const std::string& name, int64_t& out_removed);

    grpc::Status Exists(const std::string& name, bool& out_exists);

    // Distinct file names, sorted
    grpc::Status ListNames(std::vector<std::string>& out_names);

    // Version a record created now for name would get
    grpc::Status NextVersion(const std::string& name, int64_t& out_version);

    const std::string& root() const { return root_; }

private:
    Document NameFilter(const std::string& name) const;

    std::shared_ptr<Collection> files_;
    std::string root_;
};

}  // namespace gridstore_client
