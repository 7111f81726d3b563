#pragma once

#include "gridstore_client/document.hpp"
#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gridstore_client {

/**
 * IdGenerator: Produces unique document identifiers
 *
 * Identifiers are RFC 4122 random UUIDs in lowercase text form,
 * e.g. "1b4e28ba-2fa1-11d2-883f-0016d3cca427".
 */
class IdGenerator {
public:
    static std::string NewId();
};

/**
 * Collection: Generic key-document store used by the GridFS layer
 *
 * Every call reports failure through grpc::Status. Implementations never
 * retry; whatever status the underlying store produced is returned as-is.
 *
 * Filters are top-level field equality. A document inserted without an
 * "_id" field receives one from IdGenerator.
 *
 * Implementations:
 *   MemoryCollection  - in-process, mutex protected
 *   RemoteCollection  - CollectionService over gRPC
 */
class Collection {
public:
    virtual ~Collection() = default;

    virtual grpc::Status Insert(const Document& document, std::string& out_id) = 0;

    virtual grpc::Status Find(const Query& query, std::vector<Document>& out_documents) = 0;

    /**
     * Replace the first document matching filter, or insert document
     * when nothing matches. The replacement keeps the matched document's
     * "_id" unless document carries its own.
     */
    virtual grpc::Status Upsert(const Document& filter, const Document& document,
                                bool& out_inserted) = 0;

    virtual grpc::Status Remove(const Document& filter, int64_t& out_removed) = 0;

    virtual grpc::Status Count(const Document& filter, int64_t& out_count) = 0;

    const std::string& name() const { return name_; }

protected:
    explicit Collection(std::string name) : name_(std::move(name)) {}

private:
    std::string name_;
};

struct ServerInfo {
    std::string version;
    double ok = 0.0;
};

/**
 * Backend: Source of collections plus database-level administration
 *
 * Collections are addressed by (database, collection) name. Backends hand
 * out shared handles; two calls with the same names observe the same data.
 */
class Backend {
public:
    virtual ~Backend() = default;

    virtual std::shared_ptr<Collection> GetCollection(const std::string& database,
                                                      const std::string& collection) = 0;

    virtual grpc::Status GetServerInfo(ServerInfo& out_info) = 0;

    // database name -> approximate size in bytes
    virtual grpc::Status ListDatabases(std::map<std::string, int64_t>& out_sizes) = 0;

    virtual grpc::Status DropDatabase(const std::string& database) = 0;

    virtual grpc::Status CopyDatabase(const std::string& from_database,
                                      const std::string& to_database) = 0;
};

}  // namespace gridstore_client
