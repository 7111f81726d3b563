#include "gridstore_client/file_record_store.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace gridstore_client {

namespace {
constexpr const char* kFilenameField = "filename";
constexpr const char* kNamespaceField = "namespace";
constexpr const char* kLengthField = "length";
constexpr const char* kChunkSizeField = "chunkSize";
constexpr const char* kUploadDateField = "uploadDate";
constexpr const char* kContentTypeField = "contentType";
constexpr const char* kMetadataField = "metadata";
constexpr const char* kMd5Field = "md5";
constexpr const char* kVersionField = "version";

grpc::Status MissingField(const char* field) {
    return grpc::Status(grpc::StatusCode::DATA_LOSS,
                        std::string("file record is missing field '") + field + "'");
}

// Most recent first
void AddRecencySort(Query& query) {
    for (const char* field : {kVersionField, kUploadDateField, kIdField}) {
        auto* sort = query.add_sort();
        sort->set_field(field);
        sort->set_descending(true);
    }
}
}  // namespace

// ============================================================================
// FileRecord
// ============================================================================

Document FileRecord::ToDocument() const {
    Document doc;
    SetField(doc, kIdField, MakeString(id));
    SetField(doc, kFilenameField, MakeString(name));
    SetField(doc, kNamespaceField, MakeString(root));
    SetField(doc, kLengthField, MakeInt(static_cast<int64_t>(length)));
    SetField(doc, kChunkSizeField, MakeInt(static_cast<int64_t>(chunk_size)));
    SetField(doc, kUploadDateField, MakeInt(upload_date_ms));
    SetField(doc, kContentTypeField, MakeString(content_type));
    if (metadata) {
        SetField(doc, kMetadataField, MakeDocument(*metadata));
    }
    SetField(doc, kMd5Field, MakeString(md5));
    SetField(doc, kVersionField, MakeInt(version));
    return doc;
}

grpc::Status FileRecord::FromDocument(const Document& doc, FileRecord& out_record) {
    FileRecord record;

    auto id = GetString(doc, kIdField);
    if (!id) return MissingField(kIdField);
    record.id = *id;

    auto name = GetString(doc, kFilenameField);
    if (!name) return MissingField(kFilenameField);
    record.name = *name;

    auto length = GetInt(doc, kLengthField);
    if (!length || *length < 0) return MissingField(kLengthField);
    record.length = static_cast<uint64_t>(*length);

    auto chunk_size = GetInt(doc, kChunkSizeField);
    if (!chunk_size || *chunk_size <= 0) return MissingField(kChunkSizeField);
    record.chunk_size = static_cast<uint64_t>(*chunk_size);

    auto upload_date = GetInt(doc, kUploadDateField);
    if (!upload_date) return MissingField(kUploadDateField);
    record.upload_date_ms = *upload_date;

    record.root = GetString(doc, kNamespaceField).value_or(kDefaultRoot);
    record.content_type = GetString(doc, kContentTypeField).value_or(kDefaultContentType);
    record.metadata = GetDocument(doc, kMetadataField);
    record.md5 = GetString(doc, kMd5Field).value_or("");
    record.version = GetInt(doc, kVersionField).value_or(1);

    out_record = std::move(record);
    return grpc::Status::OK;
}

// ============================================================================
// FileRecordStore
// ============================================================================

FileRecordStore::FileRecordStore(std::shared_ptr<Collection> files, const std::string& root)
    : files_(std::move(files)), root_(root) {}

Document FileRecordStore::NameFilter(const std::string& name) const {
    Document filter;
    SetField(filter, kFilenameField, MakeString(name));
    SetField(filter, kNamespaceField, MakeString(root_));
    return filter;
}

grpc::Status FileRecordStore::FindLatestByName(const std::string& name,
                                               FileRecord& out_record) {
    Query query;
    *query.mutable_filter() = NameFilter(name);
    AddRecencySort(query);
    query.set_limit(1);

    std::vector<Document> found;
    grpc::Status status = files_->Find(query, found);
    if (!status.ok()) {
        return status;
    }
    if (found.empty()) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "file '" + name + "' not found in root '" + root_ + "'");
    }
    return FileRecord::FromDocument(found.front(), out_record);
}

grpc::Status FileRecordStore::FindAllByName(const std::string& name,
                                            std::vector<FileRecord>& out_records) {
    Query query;
    *query.mutable_filter() = NameFilter(name);
    AddRecencySort(query);

    std::vector<Document> found;
    grpc::Status status = files_->Find(query, found);
    if (!status.ok()) {
        return status;
    }

    out_records.clear();
    for (const auto& doc : found) {
        FileRecord record;
        status = FileRecord::FromDocument(doc, record);
        if (!status.ok()) {
            return status;
        }
        out_records.push_back(std::move(record));
    }
    return grpc::Status::OK;
}

grpc::Status FileRecordStore::FindById(const std::string& id, FileRecord& out_record) {
    Query query;
    SetField(*query.mutable_filter(), kIdField, MakeString(id));
    query.set_limit(1);

    std::vector<Document> found;
    grpc::Status status = files_->Find(query, found);
    if (!status.ok()) {
        return status;
    }
    if (found.empty()) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "file id " + id + " not found");
    }
    return FileRecord::FromDocument(found.front(), out_record);
}

grpc::Status FileRecordStore::Insert(FileRecord& record) {
    if (record.id.empty()) {
        record.id = IdGenerator::NewId();
    }
    record.root = root_;

    std::string assigned_id;
    grpc::Status status = files_->Insert(record.ToDocument(), assigned_id);
    if (!status.ok()) {
        std::cerr << "FileRecordStore: Failed to insert record for '" << record.name
                  << "': " << status.error_message() << std::endl;
        return status;
    }

    std::cout << "FileRecordStore: Inserted '" << record.name << "' version "
              << record.version << " (id " << record.id << ", " << record.length
              << " bytes)" << std::endl;
    return grpc::Status::OK;
}

grpc::Status FileRecordStore::Update(const FileRecord& record) {
    Document filter;
    SetField(filter, kIdField, MakeString(record.id));

    int64_t count = 0;
    grpc::Status status = files_->Count(filter, count);
    if (!status.ok()) {
        return status;
    }
    if (count == 0) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "cannot update file id " + record.id + ": not found");
    }

    FileRecord stored = record;
    stored.root = root_;
    bool inserted = false;
    status = files_->Upsert(filter, stored.ToDocument(), inserted);
    if (!status.ok()) {
        std::cerr << "FileRecordStore: Failed to update record for '" << record.name
                  << "': " << status.error_message() << std::endl;
        return status;
    }

    std::cout << "FileRecordStore: Updated '" << record.name << "' (id " << record.id
              << ", " << record.length << " bytes)" << std::endl;
    return grpc::Status::OK;
}

grpc::Status FileRecordStore::DeleteByName(const std::string& name, int64_t& out_removed) {
    return files_->Remove(NameFilter(name), out_removed);
}

grpc::Status FileRecordStore::Exists(const std::string& name, bool& out_exists) {
    int64_t count = 0;
    grpc::Status status = files_->Count(NameFilter(name), count);
    if (status.ok()) {
        out_exists = count > 0;
    }
    return status;
}

grpc::Status FileRecordStore::ListNames(std::vector<std::string>& out_names) {
    Query query;
    SetField(*query.mutable_filter(), kNamespaceField, MakeString(root_));

    std::vector<Document> found;
    grpc::Status status = files_->Find(query, found);
    if (!status.ok()) {
        return status;
    }

    std::set<std::string> names;
    for (const auto& doc : found) {
        auto name = GetString(doc, kFilenameField);
        if (name) {
            names.insert(*name);
        }
    }
    out_names.assign(names.begin(), names.end());
    return grpc::Status::OK;
}

grpc::Status FileRecordStore::NextVersion(const std::string& name, int64_t& out_version) {
    FileRecord latest;
    grpc::Status status = FindLatestByName(name, latest);
    if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
        out_version = 1;
        return grpc::Status::OK;
    }
    if (!status.ok()) {
        return status;
    }
    out_version = latest.version + 1;
    return grpc::Status::OK;
}

}  // namespace gridstore_client
