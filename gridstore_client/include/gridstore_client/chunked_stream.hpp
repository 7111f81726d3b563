#pragma once

#include "gridstore_client/chunk_store.hpp"
#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <optional>
#include <string>

namespace gridstore_client {

/**
 * Session mode, fixed at open.
 *   kRead   "r"   existing file, read only
 *   kWrite  "w"   new file version, content ends at the final position
 *   kModify "w+"  existing file (or new), edit in place or append
 */
enum class OpenMode {
    kRead,
    kWrite,
    kModify
};

/**
 * @return INVALID_ARGUMENT "illegal mode <token>" for anything but
 *         "r", "w" and "w+"
 */
grpc::Status ParseOpenMode(const std::string& token, OpenMode& out_mode);

const char* OpenModeToken(OpenMode mode);

enum class SeekWhence {
    kSet,
    kCurrent,
    kEnd
};

/**
 * Copy n bytes of src, starting at src_pos, into chunk at offset.
 *
 * Bytes of chunk outside [offset, offset + n) are left as they were, so a
 * write that stops short of the chunk's end keeps the old tail. The chunk
 * grows when the copy runs past its end; if offset itself is past the end
 * the gap is zero-filled.
 */
void SpliceChunk(std::string& chunk, size_t offset, const std::string& src,
                 size_t src_pos, size_t n);

/**
 * ChunkedStream: Byte-addressed view over a file's chunk sequence
 *
 * Holds one chunk in memory (the "current" chunk). Reads and writes move
 * through the file chunk by chunk; leaving a modified chunk saves it
 * through the ChunkStore first, so at most one chunk is ever unsaved.
 *
 * Length rules applied by Flush():
 *   kWrite  - length is the final position. The last chunk is trimmed and
 *             chunks past it are deleted, even if written earlier.
 *   kModify - length is the larger of the stored length and the furthest
 *             byte written.
 *   kRead   - nothing is written.
 *
 * Writing past the current end zero-fills the gap so chunk indices stay
 * contiguous.
 *
 * Not thread-safe: one caller per stream.
 */
class ChunkedStream {
public:
    /**
     * @param store         Chunk access for the file's root (not owned)
     * @param file_id       Owning file record id
     * @param file_name     Used in error messages and logs
     * @param mode          Session mode
     * @param chunk_size    Chunk size in bytes (> 0)
     * @param stored_length Length recorded before this session (0 for new)
     */
    ChunkedStream(ChunkStore& store, const std::string& file_id,
                  const std::string& file_name, OpenMode mode, uint64_t chunk_size,
                  uint64_t stored_length);

    /**
     * Read up to n bytes at the current position. Fewer bytes, down to
     * none, come back at end of file; that is not an error.
     */
    grpc::Status Read(uint64_t n, std::string& out_data);
    grpc::Status ReadToEnd(std::string& out_data);

    /**
     * Write at the current position, zero-filling any gap left by a seek
     * past the end one chunk at a time.
     * @return OUT_OF_RANGE if the file would grow past what one string can
     *         hold; RESOURCE_EXHAUSTED if memory runs out. The position is
     *         unchanged on failure.
     */
    grpc::Status Write(const std::string& data);

    /**
     * Move the position without touching stored chunks.
     * @return INVALID_ARGUMENT if the target is negative or overflows, or
     *         is past the end of a file open for reading
     */
    grpc::Status Seek(int64_t offset, SeekWhence whence = SeekWhence::kSet);
    grpc::Status Rewind();
    uint64_t Tell() const { return position_; }
    bool Eof() const { return position_ >= extent_; }

    /**
     * @return FAILED_PRECONDITION in kRead mode or once any chunk has been
     *         read, written or already exists for the file;
     *         INVALID_ARGUMENT for 0
     */
    grpc::Status SetChunkSize(uint64_t chunk_size);
    uint64_t chunk_size() const { return chunk_size_; }

    // Current readable length
    uint64_t Size() const { return extent_; }
    OpenMode mode() const { return mode_; }

    /**
     * Save the unsaved chunk and apply the mode's length rule. Called once,
     * when the session closes.
     * @param out_length Length to record in the file record
     */
    grpc::Status Flush(uint64_t& out_length);

private:
    grpc::Status LoadCurrent(uint64_t index);
    grpc::Status SaveCurrent();
    grpc::Status WriteAtPosition(const std::string& data);
    grpc::Status FillTo(uint64_t target);
    grpc::Status CheckLength(uint64_t length) const;
    grpc::Status TruncateTo(uint64_t length);

    // Largest length ReadToEnd can hand back in one string
    uint64_t MaxLength() const { return current_.max_size(); }

    uint64_t ChunkCount(uint64_t length) const {
        return (length + chunk_size_ - 1) / chunk_size_;
    }

    ChunkStore& store_;
    std::string file_id_;
    std::string file_name_;
    OpenMode mode_;
    uint64_t chunk_size_;

    uint64_t position_ = 0;
    uint64_t extent_ = 0;        // end of readable content
    bool materialized_ = false;  // a chunk was touched or already existed

    std::optional<uint64_t> current_index_;
    std::string current_;
    bool dirty_ = false;
};

}  // namespace gridstore_client
