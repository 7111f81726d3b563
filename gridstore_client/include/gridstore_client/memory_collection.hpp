#pragma once

#include "gridstore_client/collection.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gridstore_client {

/**
 * MemoryCollection: In-process Collection
 *
 * Documents are kept in insertion order; Find without a sort returns them
 * in that order. Thread-safe: every operation holds documents_mutex_.
 */
class MemoryCollection : public Collection {
public:
    explicit MemoryCollection(const std::string& name);

    grpc::Status Insert(const Document& document, std::string& out_id) override;
    grpc::Status Find(const Query& query, std::vector<Document>& out_documents) override;
    grpc::Status Upsert(const Document& filter, const Document& document,
                        bool& out_inserted) override;
    grpc::Status Remove(const Document& filter, int64_t& out_removed) override;
    grpc::Status Count(const Document& filter, int64_t& out_count) override;

    // Copy of every stored document, in insertion order
    std::vector<Document> Snapshot() const;

    // Sum of encoded document sizes
    int64_t ByteSize() const;

private:
    std::vector<Document> documents_;
    mutable std::mutex documents_mutex_;
};

/**
 * MemoryBackend: Databases of MemoryCollections
 *
 * Collections are created on first access. A database exists while it
 * holds at least one collection with at least one document, which is what
 * ListDatabases reports.
 */
class MemoryBackend : public Backend {
public:
    static constexpr const char* kVersion = "0.1.0";

    MemoryBackend() = default;

    std::shared_ptr<Collection> GetCollection(const std::string& database,
                                              const std::string& collection) override;
    grpc::Status GetServerInfo(ServerInfo& out_info) override;
    grpc::Status ListDatabases(std::map<std::string, int64_t>& out_sizes) override;
    grpc::Status DropDatabase(const std::string& database) override;
    grpc::Status CopyDatabase(const std::string& from_database,
                              const std::string& to_database) override;

    // Typed access for the server and tests
    std::shared_ptr<MemoryCollection> GetMemoryCollection(const std::string& database,
                                                          const std::string& collection);

private:
    using CollectionMap = std::map<std::string, std::shared_ptr<MemoryCollection>>;

    std::map<std::string, CollectionMap> databases_;
    std::mutex databases_mutex_;
};

}  // namespace gridstore_client
