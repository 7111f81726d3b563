#pragma once

#include "gridstore_service/gridstore.grpc.pb.h"
#include "gridstore_client/collection.hpp"
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace gridstore_client {

/**
 * ChannelPool: Fixed-size pool of gRPC channels to one server
 *
 * Each slot owns its own channel (local subchannel pool), so pool_size
 * slots mean pool_size transport connections. Channels are created the
 * first time their slot is handed out unless Connect() is called.
 *
 * A Lease returns its slot to the pool when destroyed, on every exit
 * path, whether the call made through it succeeded or not.
 *
 * Thread-safe.
 */
class ChannelPool {
public:
    using Stub = gridstore_service::CollectionService::Stub;

    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        Stub* operator->() const { return stub_; }
        Stub* get() const { return stub_; }

    private:
        friend class ChannelPool;
        Lease(ChannelPool* pool, size_t slot, Stub* stub)
            : pool_(pool), slot_(slot), stub_(stub) {}
        void Release();

        ChannelPool* pool_ = nullptr;
        size_t slot_ = 0;
        Stub* stub_ = nullptr;
    };

    /**
     * @param target    host:port of the CollectionService
     * @param pool_size Number of channels (at least 1)
     * @param timeout   Wait limit for a free slot, and per-call deadline
     * @param logger    Optional call trace sink (not owned)
     */
    ChannelPool(const std::string& target, size_t pool_size,
                std::chrono::milliseconds timeout, std::ostream* logger);

    // Create every channel now instead of on first use
    void Connect();

    /**
     * Take a free slot, waiting up to timeout for one to be returned.
     * @return DEADLINE_EXCEEDED when no slot frees up in time
     */
    grpc::Status Acquire(Lease& out_lease);

    size_t CheckedOutCount() const;

    // Deadline for a call starting now
    std::chrono::system_clock::time_point Deadline() const;

    // Write one trace line to the logger, if any
    void Log(const std::string& line);

    const std::string& target() const { return target_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    struct Slot {
        std::shared_ptr<grpc::Channel> channel;
        std::unique_ptr<Stub> stub;
    };

    void Return(size_t slot);
    void EnsureChannel(Slot& slot);

    std::string target_;
    std::chrono::milliseconds timeout_;
    std::ostream* logger_;
    std::vector<Slot> slots_;
    std::deque<size_t> idle_;
    size_t checked_out_ = 0;
    mutable std::mutex pool_mutex_;
    std::condition_variable slot_returned_;
    std::mutex logger_mutex_;
};

/**
 * RemoteCollection: Collection backed by CollectionService RPCs
 *
 * Each call leases a channel, sets the pool deadline and returns the RPC
 * status unchanged.
 */
class RemoteCollection : public Collection {
public:
    RemoteCollection(std::shared_ptr<ChannelPool> pool, const std::string& database,
                     const std::string& name);

    grpc::Status Insert(const Document& document, std::string& out_id) override;
    grpc::Status Find(const Query& query, std::vector<Document>& out_documents) override;
    grpc::Status Upsert(const Document& filter, const Document& document,
                        bool& out_inserted) override;
    grpc::Status Remove(const Document& filter, int64_t& out_removed) override;
    grpc::Status Count(const Document& filter, int64_t& out_count) override;

private:
    void Trace(const char* op);

    std::shared_ptr<ChannelPool> pool_;
    std::string database_;
};

/**
 * RemoteBackend: Backend reached through a ChannelPool
 *
 * Administration calls are traced as "admin.$cmd.<op>".
 */
class RemoteBackend : public Backend {
public:
    explicit RemoteBackend(std::shared_ptr<ChannelPool> pool);

    std::shared_ptr<Collection> GetCollection(const std::string& database,
                                              const std::string& collection) override;
    grpc::Status GetServerInfo(ServerInfo& out_info) override;
    grpc::Status ListDatabases(std::map<std::string, int64_t>& out_sizes) override;
    grpc::Status DropDatabase(const std::string& database) override;
    grpc::Status CopyDatabase(const std::string& from_database,
                              const std::string& to_database) override;

    ChannelPool& pool() { return *pool_; }

private:
    std::shared_ptr<ChannelPool> pool_;
};

}  // namespace gridstore_client
