#include "gridstore_client/memory_collection.hpp"
#include <algorithm>
#include <iterator>

namespace gridstore_client {

// ============================================================================
// MemoryCollection Implementation
// ============================================================================

MemoryCollection::MemoryCollection(const std::string& name)
    : Collection(name) {}

grpc::Status MemoryCollection::Insert(const Document& document, std::string& out_id) {
    Document stored = document;
    auto id = GetString(stored, kIdField);
    if (!id) {
        out_id = IdGenerator::NewId();
        SetField(stored, kIdField, MakeString(out_id));
    } else {
        out_id = *id;
    }

    std::lock_guard<std::mutex> lock(documents_mutex_);
    documents_.push_back(std::move(stored));
    return grpc::Status::OK;
}

grpc::Status MemoryCollection::Find(const Query& query,
                                    std::vector<Document>& out_documents) {
    out_documents.clear();
    {
        std::lock_guard<std::mutex> lock(documents_mutex_);
        for (const auto& doc : documents_) {
            if (Matches(doc, query.filter())) {
                out_documents.push_back(doc);
            }
        }
    }

    if (query.sort_size() > 0) {
        std::stable_sort(out_documents.begin(), out_documents.end(),
            [&query](const Document& a, const Document& b) {
                static const Value kNull;
                for (const auto& key : query.sort()) {
                    auto ia = a.fields().find(key.field());
                    auto ib = b.fields().find(key.field());
                    const Value& va = ia == a.fields().end() ? kNull : ia->second;
                    const Value& vb = ib == b.fields().end() ? kNull : ib->second;
                    int c = CompareValues(va, vb);
                    if (c != 0) {
                        return key.descending() ? c > 0 : c < 0;
                    }
                }
                return false;
            });
    }

    if (query.limit() > 0 && out_documents.size() > static_cast<size_t>(query.limit())) {
        out_documents.resize(query.limit());
    }
    return grpc::Status::OK;
}

grpc::Status MemoryCollection::Upsert(const Document& filter, const Document& document,
                                      bool& out_inserted) {
    std::lock_guard<std::mutex> lock(documents_mutex_);

    for (auto& doc : documents_) {
        if (Matches(doc, filter)) {
            Document replacement = document;
            if (!HasField(replacement, kIdField) && HasField(doc, kIdField)) {
                SetField(replacement, kIdField, doc.fields().at(kIdField));
            }
            doc = std::move(replacement);
            out_inserted = false;
            return grpc::Status::OK;
        }
    }

    Document stored = document;
    if (!HasField(stored, kIdField)) {
        SetField(stored, kIdField, MakeString(IdGenerator::NewId()));
    }
    documents_.push_back(std::move(stored));
    out_inserted = true;
    return grpc::Status::OK;
}

grpc::Status MemoryCollection::Remove(const Document& filter, int64_t& out_removed) {
    std::lock_guard<std::mutex> lock(documents_mutex_);
    auto it = std::remove_if(documents_.begin(), documents_.end(),
        [&filter](const Document& doc) { return Matches(doc, filter); });
    out_removed = std::distance(it, documents_.end());
    documents_.erase(it, documents_.end());
    return grpc::Status::OK;
}

grpc::Status MemoryCollection::Count(const Document& filter, int64_t& out_count) {
    std::lock_guard<std::mutex> lock(documents_mutex_);
    out_count = std::count_if(documents_.begin(), documents_.end(),
        [&filter](const Document& doc) { return Matches(doc, filter); });
    return grpc::Status::OK;
}

std::vector<Document> MemoryCollection::Snapshot() const {
    std::lock_guard<std::mutex> lock(documents_mutex_);
    return documents_;
}

int64_t MemoryCollection::ByteSize() const {
    std::lock_guard<std::mutex> lock(documents_mutex_);
    int64_t total = 0;
    for (const auto& doc : documents_) {
        total += static_cast<int64_t>(doc.ByteSizeLong());
    }
    return total;
}

// ============================================================================
// MemoryBackend Implementation
// ============================================================================

std::shared_ptr<MemoryCollection> MemoryBackend::GetMemoryCollection(
    const std::string& database, const std::string& collection) {
    std::lock_guard<std::mutex> lock(databases_mutex_);
    auto& slot = databases_[database][collection];
    if (!slot) {
        slot = std::make_shared<MemoryCollection>(collection);
    }
    return slot;
}

std::shared_ptr<Collection> MemoryBackend::GetCollection(const std::string& database,
                                                         const std::string& collection) {
    return GetMemoryCollection(database, collection);
}

grpc::Status MemoryBackend::GetServerInfo(ServerInfo& out_info) {
    out_info.version = kVersion;
    out_info.ok = 1.0;
    return grpc::Status::OK;
}

grpc::Status MemoryBackend::ListDatabases(std::map<std::string, int64_t>& out_sizes) {
    out_sizes.clear();
    std::lock_guard<std::mutex> lock(databases_mutex_);
    for (const auto& db : databases_) {
        int64_t size = 0;
        for (const auto& coll : db.second) {
            size += coll.second->ByteSize();
        }
        if (size > 0) {
            out_sizes[db.first] = size;
        }
    }
    return grpc::Status::OK;
}

grpc::Status MemoryBackend::DropDatabase(const std::string& database) {
    std::lock_guard<std::mutex> lock(databases_mutex_);
    databases_.erase(database);
    return grpc::Status::OK;
}

grpc::Status MemoryBackend::CopyDatabase(const std::string& from_database,
                                         const std::string& to_database) {
    if (from_database == to_database) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "cannot copy database '" + from_database + "' onto itself");
    }

    std::lock_guard<std::mutex> lock(databases_mutex_);
    auto from_it = databases_.find(from_database);
    if (from_it == databases_.end()) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "database '" + from_database + "' not found");
    }

    CollectionMap copy;
    for (const auto& coll : from_it->second) {
        auto target = std::make_shared<MemoryCollection>(coll.first);
        for (const auto& doc : coll.second->Snapshot()) {
            std::string id;
            auto status = target->Insert(doc, id);
            if (!status.ok()) {
                return status;
            }
        }
        copy[coll.first] = target;
    }
    databases_[to_database] = std::move(copy);
    return grpc::Status::OK;
}

}  // namespace gridstore_client
