#pragma once

#include "gridstore_client/collection.hpp"
#include "gridstore_client/remote_collection.hpp"
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace gridstore_client {

// ============================================================================
// Connection Constants
// ============================================================================
constexpr const char* kDefaultHost = "localhost";
constexpr int kDefaultPort = 27017;

struct Node {
    std::string host = kDefaultHost;
    int port = kDefaultPort;

    // "host" or "host:port". A port that is not a number in 1..65535
    // falls back to kDefaultPort.
    static Node Parse(const std::string& address);
    std::string Address() const;

    bool operator==(const Node& other) const {
        return host == other.host && port == other.port;
    }
};

// Paired (left/right) server configuration. A missing side is the
// default node.
struct NodePair {
    std::optional<Node> left;
    std::optional<Node> right;
};

struct AuthRecord {
    std::string db_name;
    std::string username;
    std::string password;

    bool operator==(const AuthRecord& other) const {
        return db_name == other.db_name && username == other.username &&
               password == other.password;
    }
};

struct ConnectionOptions {
    size_t pool_size = 1;
    std::chrono::milliseconds timeout{5000};  // pool wait and call deadline
    std::ostream* logger = nullptr;           // not owned
    bool connect = true;                      // false: create channels lazily
};

class Database;

/**
 * Connection: Entry point of the driver
 *
 * Owns the Backend every Database handle and collection is obtained from.
 * Remote connections talk to the first configured node through a
 * ChannelPool; picking another node on failure is not attempted.
 *
 * Saved authentications are bookkeeping only: one record per database,
 * kept so callers can list or drop them. They are never sent to the
 * server by this class.
 *
 * Usage:
 *   Connection conn("localhost", 27017);
 *   Database db;
 *   grpc::Status s = conn.Db("test", db);
 *   auto files = db.GetCollection("fs.files");
 */
class Connection {
public:
    explicit Connection(const std::string& host = kDefaultHost, int port = kDefaultPort,
                        const ConnectionOptions& options = ConnectionOptions());
    explicit Connection(const NodePair& nodes,
                        const ConnectionOptions& options = ConnectionOptions());

    // In-process backend (no transport, no pool)
    explicit Connection(std::shared_ptr<Backend> backend,
                        const ConnectionOptions& options = ConnectionOptions());

    /**
     * Verify the server answers. Creates any channels not created yet
     * and issues a server info call.
     */
    grpc::Status Connect();

    const std::vector<Node>& nodes() const { return nodes_; }
    std::ostream* logger() const { return options_.logger; }

    /**
     * Database handle for name.
     * @return INVALID_ARGUMENT when the name is empty or contains one of
     *         '$', '.', '\\', '/' or ' '
     */
    grpc::Status Db(const std::string& name, Database& out_db) const;

    static grpc::Status ValidateDatabaseName(const std::string& name);

    // ========== Administration ==========
    grpc::Status GetServerInfo(ServerInfo& out_info);
    grpc::Status ServerVersion(std::string& out_version);
    grpc::Status DatabaseNames(std::vector<std::string>& out_names);
    grpc::Status DatabaseInfo(std::map<std::string, int64_t>& out_sizes);
    grpc::Status DropDatabase(const std::string& name);
    grpc::Status CopyDatabase(const std::string& from_name, const std::string& to_name);

    // ========== Saved authentications ==========
    // Replaces an existing record for the same database
    void AddAuth(const std::string& db_name, const std::string& username,
                 const std::string& password);
    // @return true if a record for db_name was removed
    bool RemoveAuth(const std::string& db_name);
    void ClearAuths();
    const std::vector<AuthRecord>& auths() const { return auths_; }

    // Channels currently leased out of the pool (always 0 in-process)
    size_t CheckedOutCount() const;

private:
    void InitRemote();

    std::vector<Node> nodes_;
    ConnectionOptions options_;
    std::shared_ptr<ChannelPool> pool_;
    std::shared_ptr<Backend> backend_;
    std::vector<AuthRecord> auths_;
};

/**
 * Database: Named handle handing out collections
 *
 * Cheap to copy. A default-constructed Database is unusable until assigned
 * from Connection::Db.
 */
class Database {
public:
    Database() = default;

    const std::string& name() const { return name_; }
    bool valid() const { return backend_ != nullptr; }

    std::shared_ptr<Collection> GetCollection(const std::string& collection) const;

private:
    friend class Connection;
    Database(const std::string& name, std::shared_ptr<Backend> backend)
        : name_(name), backend_(std::move(backend)) {}

    std::string name_;
    std::shared_ptr<Backend> backend_;
};

}  // namespace gridstore_client
