#pragma once

#include "gridstore_client/collection.hpp"
#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <memory>
#include <string>

namespace gridstore_client {

/**
 * ChunkStore: Binary chunk records keyed by (file id, chunk index)
 *
 * Chunk documents are stored in the "<namespace>.chunks" collection as
 *   { _id, files_id: <file id>, n: <index>, data: <bytes> }
 *
 * SaveChunk is a single collection upsert on (files_id, n), so a chunk's
 * payload is either fully replaced or left untouched.
 *
 * Collection failures are returned unchanged.
 */
class ChunkStore {
public:
    explicit ChunkStore(std::shared_ptr<Collection> chunks);

    /**
     * @return NOT_FOUND when the file has no chunk at index
     */
    grpc::Status LoadChunk(const std::string& file_id, uint64_t index,
                           std::string& out_payload);

    grpc::Status SaveChunk(const std::string& file_id, uint64_t index,
                           const std::string& payload);

    // Remove every chunk of the file. Removing nothing is not an error.
    grpc::Status DeleteChunks(const std::string& file_id);

    // Remove chunks with index in [first_index, end_index)
    grpc::Status DeleteChunksFrom(const std::string& file_id, uint64_t first_index,
                                  uint64_t end_index);

    grpc::Status CountChunks(const std::string& file_id, int64_t& out_count);

private:
    static Document ChunkKey(const std::string& file_id, uint64_t index);

    std::shared_ptr<Collection> chunks_;
};

}  // namespace gridstore_client
