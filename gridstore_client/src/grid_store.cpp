#include "gridstore_client/grid_store.hpp"
#include <iostream>

namespace gridstore_client {

grpc::Status GridStore::Open(const Database& db, const std::string& name,
                             const std::string& mode, const Block& block,
                             const OpenOptions& options) {
    std::unique_ptr<GridFile> file;
    grpc::Status status = GridFile::Open(db, name, mode, options, file);
    if (!status.ok()) {
        return status;
    }

    // If block throws, ~GridFile closes the handle while unwinding
    grpc::Status block_status = block ? block(*file) : grpc::Status::OK;
    grpc::Status close_status = file->Close();
    return block_status.ok() ? close_status : block_status;
}

grpc::Status GridStore::Exists(const Database& db, const std::string& name,
                               bool& out_exists, const std::string& root) {
    if (!db.valid()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "database handle not initialized");
    }
    FileRecordStore records(db.GetCollection(root + ".files"), root);
    return records.Exists(name, out_exists);
}

grpc::Status GridStore::Read(const Database& db, const std::string& name,
                             std::string& out_data, std::optional<uint64_t> length,
                             std::optional<uint64_t> offset, const std::string& root) {
    OpenOptions options;
    options.root = root;
    return Open(db, name, "r", [&](GridFile& file) {
        if (offset) {
            grpc::Status status = file.Seek(static_cast<int64_t>(*offset));
            if (!status.ok()) {
                return status;
            }
        }
        return length ? file.Read(*length, out_data) : file.Read(out_data);
    }, options);
}

grpc::Status GridStore::ReadLines(const Database& db, const std::string& name,
                                  std::vector<std::string>& out_lines,
                                  const std::string& root, char separator) {
    std::string data;
    grpc::Status status = Read(db, name, data, std::nullopt, std::nullopt, root);
    if (!status.ok()) {
        return status;
    }
    out_lines = SplitLines(data, separator);
    return grpc::Status::OK;
}

grpc::Status GridStore::Unlink(const Database& db, const std::vector<std::string>& names,
                               const std::string& root) {
    if (!db.valid()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "database handle not initialized");
    }
    ChunkStore chunks(db.GetCollection(root + ".chunks"));
    FileRecordStore records(db.GetCollection(root + ".files"), root);

    for (const auto& name : names) {
        std::vector<FileRecord> versions;
        grpc::Status status = records.FindAllByName(name, versions);
        if (!status.ok()) {
            return status;
        }

        for (const auto& record : versions) {
            status = chunks.DeleteChunks(record.id);
            if (!status.ok()) {
                return status;
            }
        }

        int64_t removed = 0;
        status = records.DeleteByName(name, removed);
        if (!status.ok()) {
            return status;
        }
        if (removed > 0) {
            std::cout << "GridStore: Unlinked '" << name << "' (" << removed
                      << " version(s)) from root '" << root << "'" << std::endl;
        }
    }
    return grpc::Status::OK;
}

grpc::Status GridStore::Unlink(const Database& db, const std::string& name,
                               const std::string& root) {
    return Unlink(db, std::vector<std::string>{name}, root);
}

grpc::Status GridStore::List(const Database& db, std::vector<std::string>& out_names,
                             const std::string& root) {
    if (!db.valid()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "database handle not initialized");
    }
    FileRecordStore records(db.GetCollection(root + ".files"), root);
    return records.ListNames(out_names);
}

}  // namespace gridstore_client
