#include "gridstore_client/connection.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace gridstore_client {

// ============================================================================
// Node
// ============================================================================

Node Node::Parse(const std::string& address) {
    Node node;
    size_t colon_pos = address.rfind(':');
    if (colon_pos == std::string::npos) {
        node.host = address;
    } else {
        node.host = address.substr(0, colon_pos);
        std::string port_text = address.substr(colon_pos + 1);
        try {
            size_t parsed = 0;
            int port = std::stoi(port_text, &parsed);
            if (parsed != port_text.size() || port <= 0 || port > 65535) {
                throw std::out_of_range("port out of range");
            }
            node.port = port;
        } catch (const std::exception& e) {
            std::cerr << "Node: Invalid port '" << port_text << "' in '" << address
                      << "' (" << e.what() << "), using " << kDefaultPort << std::endl;
        }
    }
    if (node.host.empty()) {
        node.host = kDefaultHost;
    }
    return node;
}

std::string Node::Address() const {
    return host + ":" + std::to_string(port);
}

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(const std::string& host, int port, const ConnectionOptions& options)
    : options_(options) {
    nodes_.push_back(Node{host, port});
    InitRemote();
}

Connection::Connection(const NodePair& nodes, const ConnectionOptions& options)
    : options_(options) {
    nodes_.push_back(nodes.left.value_or(Node()));
    nodes_.push_back(nodes.right.value_or(Node()));
    InitRemote();
}

Connection::Connection(std::shared_ptr<Backend> backend, const ConnectionOptions& options)
    : options_(options), backend_(std::move(backend)) {}

void Connection::InitRemote() {
    pool_ = std::make_shared<ChannelPool>(nodes_.front().Address(), options_.pool_size,
                                          options_.timeout, options_.logger);
    backend_ = std::make_shared<RemoteBackend>(pool_);
    if (options_.connect) {
        pool_->Connect();
    }
}

grpc::Status Connection::Connect() {
    if (pool_) {
        pool_->Connect();
    }
    ServerInfo info;
    grpc::Status status = backend_->GetServerInfo(info);
    if (!status.ok()) {
        std::cerr << "Connection: Failed to reach " << nodes_.front().Address() << ": "
                  << status.error_message() << std::endl;
    }
    return status;
}

grpc::Status Connection::ValidateDatabaseName(const std::string& name) {
    if (name.empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "database name cannot be the empty string");
    }
    static const std::string kIllegal = "$.\\/ ";
    for (char c : kIllegal) {
        if (name.find(c) != std::string::npos) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "database names cannot contain the character '" +
                                std::string(1, c) + "': " + name);
        }
    }
    return grpc::Status::OK;
}

grpc::Status Connection::Db(const std::string& name, Database& out_db) const {
    grpc::Status status = ValidateDatabaseName(name);
    if (!status.ok()) {
        return status;
    }
    out_db = Database(name, backend_);
    return grpc::Status::OK;
}

grpc::Status Connection::GetServerInfo(ServerInfo& out_info) {
    return backend_->GetServerInfo(out_info);
}

grpc::Status Connection::ServerVersion(std::string& out_version) {
    ServerInfo info;
    grpc::Status status = backend_->GetServerInfo(info);
    if (status.ok()) {
        out_version = info.version;
    }
    return status;
}

grpc::Status Connection::DatabaseInfo(std::map<std::string, int64_t>& out_sizes) {
    return backend_->ListDatabases(out_sizes);
}

grpc::Status Connection::DatabaseNames(std::vector<std::string>& out_names) {
    std::map<std::string, int64_t> sizes;
    grpc::Status status = backend_->ListDatabases(sizes);
    if (!status.ok()) {
        return status;
    }
    out_names.clear();
    for (const auto& kv : sizes) {
        out_names.push_back(kv.first);
    }
    return grpc::Status::OK;
}

grpc::Status Connection::DropDatabase(const std::string& name) {
    grpc::Status status = ValidateDatabaseName(name);
    if (!status.ok()) {
        return status;
    }
    return backend_->DropDatabase(name);
}

grpc::Status Connection::CopyDatabase(const std::string& from_name, const std::string& to_name) {
    grpc::Status status = ValidateDatabaseName(from_name);
    if (!status.ok()) {
        return status;
    }
    status = ValidateDatabaseName(to_name);
    if (!status.ok()) {
        return status;
    }
    return backend_->CopyDatabase(from_name, to_name);
}

void Connection::AddAuth(const std::string& db_name, const std::string& username,
                         const std::string& password) {
    RemoveAuth(db_name);
    auths_.push_back(AuthRecord{db_name, username, password});
}

bool Connection::RemoveAuth(const std::string& db_name) {
    auto it = std::remove_if(auths_.begin(), auths_.end(),
        [&db_name](const AuthRecord& a) { return a.db_name == db_name; });
    bool removed = it != auths_.end();
    auths_.erase(it, auths_.end());
    return removed;
}

void Connection::ClearAuths() {
    auths_.clear();
}

size_t Connection::CheckedOutCount() const {
    return pool_ ? pool_->CheckedOutCount() : 0;
}

// ============================================================================
// Database
// ============================================================================

std::shared_ptr<Collection> Database::GetCollection(const std::string& collection) const {
    if (!backend_) {
        return nullptr;
    }
    return backend_->GetCollection(name_, collection);
}

}  // namespace gridstore_client
