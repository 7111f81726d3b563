#include "gridstore_server/collection_service.hpp"
#include <iostream>
#include <map>
#include <sstream>
#include <vector>

namespace gridstore_server {

CollectionServiceImpl::CollectionServiceImpl(
    std::shared_ptr<gridstore_client::MemoryBackend> backend)
    : backend_(std::move(backend)) {
    std::cout << "CollectionServiceImpl initialized" << std::endl;
}

void CollectionServiceImpl::RecordRequest() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    request_count_++;
}

grpc::Status CollectionServiceImpl::ResolveCollection(
    const std::string& database, const std::string& collection,
    std::shared_ptr<gridstore_client::Collection>& out) {
    if (database.empty() || collection.empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "database and collection names are required");
    }
    out = backend_->GetCollection(database, collection);
    return grpc::Status::OK;
}

grpc::Status CollectionServiceImpl::Insert(
    grpc::ServerContext* context,
    const gridstore_service::InsertRequest* request,
    gridstore_service::InsertResponse* response) {
    RecordRequest();

    std::shared_ptr<gridstore_client::Collection> coll;
    grpc::Status status = ResolveCollection(request->database(), request->collection(), coll);
    if (!status.ok()) {
        return status;
    }

    std::string id;
    status = coll->Insert(request->document(), id);
    if (status.ok()) {
        response->set_id(id);
    }
    return status;
}

grpc::Status CollectionServiceImpl::Find(
    grpc::ServerContext* context,
    const gridstore_service::FindRequest* request,
    gridstore_service::FindResponse* response) {
    RecordRequest();

    std::shared_ptr<gridstore_client::Collection> coll;
    grpc::Status status = ResolveCollection(request->database(), request->collection(), coll);
    if (!status.ok()) {
        return status;
    }

    std::vector<gridstore_client::Document> documents;
    status = coll->Find(request->query(), documents);
    if (status.ok()) {
        for (auto& doc : documents) {
            *response->add_documents() = std::move(doc);
        }
    }
    return status;
}

grpc::Status CollectionServiceImpl::Upsert(
    grpc::ServerContext* context,
    const gridstore_service::UpsertRequest* request,
    gridstore_service::UpsertResponse* response) {
    RecordRequest();

    std::shared_ptr<gridstore_client::Collection> coll;
    grpc::Status status = ResolveCollection(request->database(), request->collection(), coll);
    if (!status.ok()) {
        return status;
    }

    bool inserted = false;
    status = coll->Upsert(request->filter(), request->document(), inserted);
    if (status.ok()) {
        response->set_inserted(inserted);
    }
    return status;
}

grpc::Status CollectionServiceImpl::Remove(
    grpc::ServerContext* context,
    const gridstore_service::RemoveRequest* request,
    gridstore_service::RemoveResponse* response) {
    RecordRequest();

    std::shared_ptr<gridstore_client::Collection> coll;
    grpc::Status status = ResolveCollection(request->database(), request->collection(), coll);
    if (!status.ok()) {
        return status;
    }

    int64_t removed = 0;
    status = coll->Remove(request->filter(), removed);
    if (status.ok()) {
        response->set_removed(removed);
    }
    return status;
}

grpc::Status CollectionServiceImpl::Count(
    grpc::ServerContext* context,
    const gridstore_service::CountRequest* request,
    gridstore_service::CountResponse* response) {
    RecordRequest();

    std::shared_ptr<gridstore_client::Collection> coll;
    grpc::Status status = ResolveCollection(request->database(), request->collection(), coll);
    if (!status.ok()) {
        return status;
    }

    int64_t count = 0;
    status = coll->Count(request->filter(), count);
    if (status.ok()) {
        response->set_count(count);
    }
    return status;
}

grpc::Status CollectionServiceImpl::ServerInfo(
    grpc::ServerContext* context,
    const gridstore_service::ServerInfoRequest* request,
    gridstore_service::ServerInfoResponse* response) {
    RecordRequest();

    gridstore_client::ServerInfo info;
    grpc::Status status = backend_->GetServerInfo(info);
    if (status.ok()) {
        response->set_version(info.version);
        response->set_ok(info.ok);
    }
    return status;
}

grpc::Status CollectionServiceImpl::ListDatabases(
    grpc::ServerContext* context,
    const gridstore_service::ListDatabasesRequest* request,
    gridstore_service::ListDatabasesResponse* response) {
    RecordRequest();

    std::map<std::string, int64_t> sizes;
    grpc::Status status = backend_->ListDatabases(sizes);
    if (status.ok()) {
        for (const auto& kv : sizes) {
            (*response->mutable_sizes())[kv.first] = kv.second;
        }
    }
    return status;
}

grpc::Status CollectionServiceImpl::DropDatabase(
    grpc::ServerContext* context,
    const gridstore_service::DropDatabaseRequest* request,
    gridstore_service::AdminResponse* response) {
    RecordRequest();

    if (request->database().empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "database name is required");
    }
    grpc::Status status = backend_->DropDatabase(request->database());
    response->set_success(status.ok());
    if (status.ok()) {
        std::cout << "Dropped database " << request->database() << std::endl;
    }
    return status;
}

grpc::Status CollectionServiceImpl::CopyDatabase(
    grpc::ServerContext* context,
    const gridstore_service::CopyDatabaseRequest* request,
    gridstore_service::AdminResponse* response) {
    RecordRequest();

    if (request->from_database().empty() || request->to_database().empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "source and target database names are required");
    }
    grpc::Status status = backend_->CopyDatabase(request->from_database(),
                                                 request->to_database());
    response->set_success(status.ok());
    if (status.ok()) {
        std::cout << "Copied database " << request->from_database() << " to "
                  << request->to_database() << std::endl;
    }
    return status;
}

std::string CollectionServiceImpl::GetStatistics() {
    std::map<std::string, int64_t> sizes;
    grpc::Status status = backend_->ListDatabases(sizes);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    std::stringstream ss;
    ss << "=== Collection Server Statistics ===" << std::endl
       << "Requests served: " << request_count_ << std::endl;
    if (!status.ok()) {
        ss << "Databases: unavailable (" << status.error_message() << ")" << std::endl;
        return ss.str();
    }
    ss << "Databases: " << sizes.size() << std::endl;
    for (const auto& kv : sizes) {
        ss << "  " << kv.first << ": " << kv.second << " bytes" << std::endl;
    }
    return ss.str();
}

}  // namespace gridstore_server
