#include "gridstore_client/remote_collection.hpp"
#include <algorithm>
#include <iostream>

namespace gridstore_client {

// ============================================================================
// ChannelPool::Lease
// ============================================================================

ChannelPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), slot_(other.slot_), stub_(other.stub_) {
    other.pool_ = nullptr;
    other.stub_ = nullptr;
}

ChannelPool::Lease& ChannelPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        slot_ = other.slot_;
        stub_ = other.stub_;
        other.pool_ = nullptr;
        other.stub_ = nullptr;
    }
    return *this;
}

ChannelPool::Lease::~Lease() {
    Release();
}

void ChannelPool::Lease::Release() {
    if (pool_) {
        pool_->Return(slot_);
        pool_ = nullptr;
        stub_ = nullptr;
    }
}

// ============================================================================
// ChannelPool
// ============================================================================

ChannelPool::ChannelPool(const std::string& target, size_t pool_size,
                         std::chrono::milliseconds timeout, std::ostream* logger)
    : target_(target), timeout_(timeout), logger_(logger) {
    pool_size = std::max<size_t>(pool_size, 1);
    slots_.resize(pool_size);
    for (size_t i = 0; i < pool_size; ++i) {
        idle_.push_back(i);
    }
}

void ChannelPool::EnsureChannel(Slot& slot) {
    if (slot.stub) {
        return;
    }
    // Separate subchannel pool per slot, otherwise all channels to the
    // same target share one connection.
    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_USE_LOCAL_SUBCHANNEL_POOL, 1);
    slot.channel = grpc::CreateCustomChannel(target_, grpc::InsecureChannelCredentials(), args);
    slot.stub = gridstore_service::CollectionService::NewStub(slot.channel);
}

void ChannelPool::Connect() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    for (auto& slot : slots_) {
        EnsureChannel(slot);
    }
    std::cout << "ChannelPool: Connected " << slots_.size() << " channel(s) to "
              << target_ << std::endl;
}

grpc::Status ChannelPool::Acquire(Lease& out_lease) {
    std::unique_lock<std::mutex> lock(pool_mutex_);
    if (!slot_returned_.wait_for(lock, timeout_, [this] { return !idle_.empty(); })) {
        return grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED,
                            "no free connection to " + target_ + " within " +
                            std::to_string(timeout_.count()) + " ms");
    }

    size_t slot = idle_.front();
    idle_.pop_front();
    EnsureChannel(slots_[slot]);
    ++checked_out_;
    Stub* stub = slots_[slot].stub.get();
    lock.unlock();

    // Assigning may return a slot the caller already held, which locks again
    out_lease = Lease(this, slot, stub);
    return grpc::Status::OK;
}

void ChannelPool::Return(size_t slot) {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        idle_.push_back(slot);
        --checked_out_;
    }
    slot_returned_.notify_one();
}

size_t ChannelPool::CheckedOutCount() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return checked_out_;
}

std::chrono::system_clock::time_point ChannelPool::Deadline() const {
    return std::chrono::system_clock::now() + timeout_;
}

void ChannelPool::Log(const std::string& line) {
    if (!logger_) {
        return;
    }
    std::lock_guard<std::mutex> lock(logger_mutex_);
    *logger_ << "DEBUG " << line << std::endl;
}

// ============================================================================
// RemoteCollection
// ============================================================================

RemoteCollection::RemoteCollection(std::shared_ptr<ChannelPool> pool,
                                   const std::string& database, const std::string& name)
    : Collection(name), pool_(std::move(pool)), database_(database) {}

void RemoteCollection::Trace(const char* op) {
    pool_->Log(database_ + "." + name() + "." + op);
}

grpc::Status RemoteCollection::Insert(const Document& document, std::string& out_id) {
    ChannelPool::Lease lease;
    grpc::Status status = pool_->Acquire(lease);
    if (!status.ok()) {
        return status;
    }
    Trace("insert");

    gridstore_service::InsertRequest request;
    request.set_database(database_);
    request.set_collection(name());
    *request.mutable_document() = document;

    gridstore_service::InsertResponse response;
    grpc::ClientContext context;
    context.set_deadline(pool_->Deadline());

    status = lease->Insert(&context, request, &response);
    if (status.ok()) {
        out_id = response.id();
    }
    return status;
}

grpc::Status RemoteCollection::Find(const Query& query, std::vector<Document>& out_documents) {
    ChannelPool::Lease lease;
    grpc::Status status = pool_->Acquire(lease);
    if (!status.ok()) {
        return status;
    }
    Trace("find");

    gridstore_service::FindRequest request;
    request.set_database(database_);
    request.set_collection(name());
    *request.mutable_query() = query;

    gridstore_service::FindResponse response;
    grpc::ClientContext context;
    context.set_deadline(pool_->Deadline());

    status = lease->Find(&context, request, &response);
    if (status.ok()) {
        out_documents.assign(response.documents().begin(), response.documents().end());
    }
    return status;
}

grpc::Status RemoteCollection::Upsert(const Document& filter, const Document& document,
                                      bool& out_inserted) {
    ChannelPool::Lease lease;
    grpc::Status status = pool_->Acquire(lease);
    if (!status.ok()) {
        return status;
    }
    Trace("update");

    gridstore_service::UpsertRequest request;
    request.set_database(database_);
    request.set_collection(name());
    *request.mutable_filter() = filter;
    *request.mutable_document() = document;

    gridstore_service::UpsertResponse response;
    grpc::ClientContext context;
    context.set_deadline(pool_->Deadline());

    status = lease->Upsert(&context, request, &response);
    if (status.ok()) {
        out_inserted = response.inserted();
    }
    return status;
}

grpc::Status RemoteCollection::Remove(const Document& filter, int64_t& out_removed) {
    ChannelPool::Lease lease;
    grpc::Status status = pool_->Acquire(lease);
    if (!status.ok()) {
        return status;
    }
    Trace("remove");

    gridstore_service::RemoveRequest request;
    request.set_database(database_);
    request.set_collection(name());
    *request.mutable_filter() = filter;

    gridstore_service::RemoveResponse response;
    grpc::ClientContext context;
    context.set_deadline(pool_->Deadline());

    status = lease->Remove(&context, request, &response);
    if (status.ok()) {
        out_removed = response.removed();
    }
    return status;
}

grpc::Status RemoteCollection::Count(const Document& filter, int64_t& out_count) {
    ChannelPool::Lease lease;
    grpc::Status status = pool_->Acquire(lease);
    if (!status.ok()) {
        return status;
    }
    Trace("count");

    gridstore_service::CountRequest request;
    request.set_database(database_);
    request.set_collection(name());
    *request.mutable_filter() = filter;

    gridstore_service::CountResponse response;
    grpc::ClientContext context;
    context.set_deadline(pool_->Deadline());

    status = lease->Count(&context, request, &response);
    if (status.ok()) {
        out_count = response.count();
    }
    return status;
}

// ============================================================================
// RemoteBackend
// ============================================================================

RemoteBackend::RemoteBackend(std::shared_ptr<ChannelPool> pool)
    : pool_(std::move(pool)) {}

std::shared_ptr<Collection> RemoteBackend::GetCollection(const std::string& database,
                                                         const std::string& collection) {
    return std::make_shared<RemoteCollection>(pool_, database, collection);
}

grpc::Status RemoteBackend::GetServerInfo(ServerInfo& out_info) {
    ChannelPool::Lease lease;
    grpc::Status status = pool_->Acquire(lease);
    if (!status.ok()) {
        return status;
    }
    pool_->Log("admin.$cmd.find serverInfo");

    gridstore_service::ServerInfoRequest request;
    gridstore_service::ServerInfoResponse response;
    grpc::ClientContext context;
    context.set_deadline(pool_->Deadline());

    status = lease->ServerInfo(&context, request, &response);
    if (status.ok()) {
        out_info.version = response.version();
        out_info.ok = response.ok();
    }
    return status;
}

grpc::Status RemoteBackend::ListDatabases(std::map<std::string, int64_t>& out_sizes) {
    ChannelPool::Lease lease;
    grpc::Status status = pool_->Acquire(lease);
    if (!status.ok()) {
        return status;
    }
    pool_->Log("admin.$cmd.find listDatabases");

    gridstore_service::ListDatabasesRequest request;
    gridstore_service::ListDatabasesResponse response;
    grpc::ClientContext context;
    context.set_deadline(pool_->Deadline());

    status = lease->ListDatabases(&context, request, &response);
    if (status.ok()) {
        out_sizes.clear();
        for (const auto& kv : response.sizes()) {
            out_sizes[kv.first] = kv.second;
        }
    }
    return status;
}

grpc::Status RemoteBackend::DropDatabase(const std::string& database) {
    ChannelPool::Lease lease;
    grpc::Status status = pool_->Acquire(lease);
    if (!status.ok()) {
        return status;
    }
    pool_->Log(database + ".$cmd.find dropDatabase");

    gridstore_service::DropDatabaseRequest request;
    request.set_database(database);
    gridstore_service::AdminResponse response;
    grpc::ClientContext context;
    context.set_deadline(pool_->Deadline());

    return lease->DropDatabase(&context, request, &response);
}

grpc::Status RemoteBackend::CopyDatabase(const std::string& from_database,
                                         const std::string& to_database) {
    ChannelPool::Lease lease;
    grpc::Status status = pool_->Acquire(lease);
    if (!status.ok()) {
        return status;
    }
    pool_->Log("admin.$cmd.find copydb");

    gridstore_service::CopyDatabaseRequest request;
    request.set_from_database(from_database);
    request.set_to_database(to_database);
    gridstore_service::AdminResponse response;
    grpc::ClientContext context;
    context.set_deadline(pool_->Deadline());

    return lease->CopyDatabase(&context, request, &response);
}

}  // namespace gridstore_client
