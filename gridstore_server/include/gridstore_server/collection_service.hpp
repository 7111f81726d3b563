#pragma once

#include "gridstore_service/gridstore.grpc.pb.h"
#include "gridstore_client/memory_collection.hpp"
#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace gridstore_server {

/**
 * CollectionServiceImpl: gRPC front end for a MemoryBackend
 *
 * Serves the document operations used by the driver:
 * - Insert / Find / Upsert / Remove / Count on (database, collection)
 * - ServerInfo, ListDatabases, DropDatabase, CopyDatabase
 *
 * Database and collection names must be non-empty; anything else is
 * rejected with INVALID_ARGUMENT before touching the backend.
 *
 * Thread-safe: the backend and its collections lock internally.
 *
 * Usage:
 *   auto backend = std::make_shared<gridstore_client::MemoryBackend>();
 *   CollectionServiceImpl service(backend);
 *   grpc::ServerBuilder builder;
 *   builder.AddListeningPort("0.0.0.0:27017", grpc::InsecureServerCredentials());
 *   builder.RegisterService(&service);
 *   auto server = builder.BuildAndStart();
 */
class CollectionServiceImpl final : public gridstore_service::CollectionService::Service {
public:
    explicit CollectionServiceImpl(std::shared_ptr<gridstore_client::MemoryBackend> backend);

    grpc::Status Insert(grpc::ServerContext* context,
                        const gridstore_service::InsertRequest* request,
                        gridstore_service::InsertResponse* response) override;

    grpc::Status Find(grpc::ServerContext* context,
                      const gridstore_service::FindRequest* request,
                      gridstore_service::FindResponse* response) override;

    grpc::Status Upsert(grpc::ServerContext* context,
                        const gridstore_service::UpsertRequest* request,
                        gridstore_service::UpsertResponse* response) override;

    grpc::Status Remove(grpc::ServerContext* context,
                        const gridstore_service::RemoveRequest* request,
                        gridstore_service::RemoveResponse* response) override;

    grpc::Status Count(grpc::ServerContext* context,
                       const gridstore_service::CountRequest* request,
                       gridstore_service::CountResponse* response) override;

    grpc::Status ServerInfo(grpc::ServerContext* context,
                            const gridstore_service::ServerInfoRequest* request,
                            gridstore_service::ServerInfoResponse* response) override;

    grpc::Status ListDatabases(grpc::ServerContext* context,
                               const gridstore_service::ListDatabasesRequest* request,
                               gridstore_service::ListDatabasesResponse* response) override;

    grpc::Status DropDatabase(grpc::ServerContext* context,
                              const gridstore_service::DropDatabaseRequest* request,
                              gridstore_service::AdminResponse* response) override;

    grpc::Status CopyDatabase(grpc::ServerContext* context,
                              const gridstore_service::CopyDatabaseRequest* request,
                              gridstore_service::AdminResponse* response) override;

    /**
     * Get statistics about this server
     */
    std::string GetStatistics();

private:
    grpc::Status ResolveCollection(const std::string& database, const std::string& collection,
                                   std::shared_ptr<gridstore_client::Collection>& out);
    void RecordRequest();

    std::shared_ptr<gridstore_client::MemoryBackend> backend_;
    uint64_t request_count_ = 0;
    std::mutex stats_mutex_;
};

}  // namespace gridstore_server
