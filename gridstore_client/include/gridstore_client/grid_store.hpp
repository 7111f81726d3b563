#pragma once

#include "gridstore_client/connection.hpp"
#include "gridstore_client/grid_file.hpp"
#include <grpcpp/grpcpp.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gridstore_client {

/**
 * GridStore: Whole-file operations on a database's GridFS roots
 *
 * Every call opens and closes its own session. Names are looked up in one
 * root; the same name in another root is a different file.
 */
class GridStore {
public:
    using Block = std::function<grpc::Status(GridFile&)>;

    /**
     * Open name, run block on the handle, close it.
     *
     * The handle is closed on every exit path, including a block that
     * throws. The block's failure takes precedence over a close failure.
     * An empty block just opens and closes.
     */
    static grpc::Status Open(const Database& db, const std::string& name,
                             const std::string& mode, const Block& block,
                             const OpenOptions& options = OpenOptions());

    static grpc::Status Exists(const Database& db, const std::string& name,
                               bool& out_exists, const std::string& root = kDefaultRoot);

    /**
     * Read length bytes at offset (defaults: everything, from 0).
     */
    static grpc::Status Read(const Database& db, const std::string& name,
                             std::string& out_data,
                             std::optional<uint64_t> length = std::nullopt,
                             std::optional<uint64_t> offset = std::nullopt,
                             const std::string& root = kDefaultRoot);

    static grpc::Status ReadLines(const Database& db, const std::string& name,
                                  std::vector<std::string>& out_lines,
                                  const std::string& root = kDefaultRoot,
                                  char separator = '\n');

    /**
     * Delete every record with the name, and all their chunks. Missing
     * names are skipped.
     */
    static grpc::Status Unlink(const Database& db, const std::vector<std::string>& names,
                               const std::string& root = kDefaultRoot);
    static grpc::Status Unlink(const Database& db, const std::string& name,
                               const std::string& root = kDefaultRoot);

    // Distinct file names stored in root
    static grpc::Status List(const Database& db, std::vector<std::string>& out_names,
                             const std::string& root = kDefaultRoot);
};

}  // namespace gridstore_client
