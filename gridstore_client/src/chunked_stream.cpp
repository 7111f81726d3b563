#include "gridstore_client/chunked_stream.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>

namespace gridstore_client {

grpc::Status ParseOpenMode(const std::string& token, OpenMode& out_mode) {
    if (token == "r") {
        out_mode = OpenMode::kRead;
    } else if (token == "w") {
        out_mode = OpenMode::kWrite;
    } else if (token == "w+") {
        out_mode = OpenMode::kModify;
    } else {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "illegal mode " + token);
    }
    return grpc::Status::OK;
}

const char* OpenModeToken(OpenMode mode) {
    switch (mode) {
        case OpenMode::kRead: return "r";
        case OpenMode::kWrite: return "w";
        case OpenMode::kModify: return "w+";
    }
    return "?";
}

void SpliceChunk(std::string& chunk, size_t offset, const std::string& src,
                 size_t src_pos, size_t n) {
    // Ensure chunk is large enough for the write
    size_t required_size = offset + n;
    if (chunk.size() < required_size) {
        chunk.resize(required_size, '\0');
    }
    std::copy(src.begin() + src_pos, src.begin() + src_pos + n, chunk.begin() + offset);
}

// ============================================================================
// ChunkedStream Implementation
// ============================================================================

ChunkedStream::ChunkedStream(ChunkStore& store, const std::string& file_id,
                             const std::string& file_name, OpenMode mode,
                             uint64_t chunk_size, uint64_t stored_length)
    : store_(store),
      file_id_(file_id),
      file_name_(file_name),
      mode_(mode),
      chunk_size_(chunk_size),
      extent_(stored_length),
      materialized_(stored_length > 0) {
    // Appending: modify sessions start at the end of existing content
    if (mode_ == OpenMode::kModify) {
        position_ = stored_length;
    }
}

grpc::Status ChunkedStream::SaveCurrent() {
    if (!dirty_ || !current_index_) {
        return grpc::Status::OK;
    }
    grpc::Status status = store_.SaveChunk(file_id_, *current_index_, current_);
    if (status.ok()) {
        dirty_ = false;
    }
    return status;
}

grpc::Status ChunkedStream::LoadCurrent(uint64_t index) {
    if (current_index_ && *current_index_ == index) {
        return grpc::Status::OK;
    }

    grpc::Status status = SaveCurrent();
    if (!status.ok()) {
        return status;
    }

    materialized_ = true;
    current_index_.reset();
    current_.clear();

    // Every chunk starting below extent_ is stored: it was either there at
    // open or saved when the stream moved off it.
    if (index * chunk_size_ < extent_) {
        status = store_.LoadChunk(file_id_, index, current_);
        if (!status.ok()) {
            std::cerr << "ChunkedStream: Failed to load chunk " << index << " of '"
                      << file_name_ << "': " << status.error_message() << std::endl;
            return status;
        }
    }
    current_index_ = index;
    return grpc::Status::OK;
}

grpc::Status ChunkedStream::Read(uint64_t n, std::string& out_data) {
    out_data.clear();
    if (mode_ == OpenMode::kWrite) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                            "read not permitted: file '" + file_name_ +
                            "' is open in mode w");
    }
    if (position_ >= extent_) {
        return grpc::Status::OK;
    }

    uint64_t remaining = std::min(n, extent_ - position_);
    out_data.reserve(remaining);

    while (remaining > 0) {
        uint64_t index = position_ / chunk_size_;
        uint64_t offset = position_ % chunk_size_;

        grpc::Status status = LoadCurrent(index);
        if (!status.ok()) {
            return status;
        }
        if (offset >= current_.size()) {
            return grpc::Status(grpc::StatusCode::DATA_LOSS,
                                "chunk " + std::to_string(index) + " of '" + file_name_ +
                                "' holds " + std::to_string(current_.size()) +
                                " bytes, expected more than " + std::to_string(offset));
        }

        uint64_t take = std::min<uint64_t>(remaining, current_.size() - offset);
        out_data.append(current_, offset, take);
        position_ += take;
        remaining -= take;
    }
    return grpc::Status::OK;
}

grpc::Status ChunkedStream::ReadToEnd(std::string& out_data) {
    uint64_t remaining = position_ < extent_ ? extent_ - position_ : 0;
    return Read(remaining, out_data);
}

grpc::Status ChunkedStream::WriteAtPosition(const std::string& data) {
    size_t consumed = 0;
    while (consumed < data.size()) {
        uint64_t index = position_ / chunk_size_;
        uint64_t offset = position_ % chunk_size_;

        grpc::Status status = LoadCurrent(index);
        if (!status.ok()) {
            return status;
        }

        size_t take = std::min<uint64_t>(data.size() - consumed, chunk_size_ - offset);
        SpliceChunk(current_, offset, data, consumed, take);
        dirty_ = true;

        consumed += take;
        position_ += take;
        extent_ = std::max(extent_, position_);
    }
    return grpc::Status::OK;
}

grpc::Status ChunkedStream::CheckLength(uint64_t length) const {
    if (length > MaxLength()) {
        return grpc::Status(grpc::StatusCode::OUT_OF_RANGE,
                            "file '" + file_name_ + "' cannot grow to " +
                            std::to_string(length) + " bytes (limit " +
                            std::to_string(MaxLength()) + ")");
    }
    return grpc::Status::OK;
}

grpc::Status ChunkedStream::FillTo(uint64_t target) {
    if (target <= extent_) {
        return grpc::Status::OK;
    }
    grpc::Status status = CheckLength(target);
    if (!status.ok()) {
        return status;
    }

    uint64_t saved_position = position_;
    try {
        // Zero-fill one chunk at a time from a single reused buffer
        std::string zeros(std::min(chunk_size_, target - extent_), '\0');
        position_ = extent_;
        while (position_ < target) {
            uint64_t index = position_ / chunk_size_;
            uint64_t offset = position_ % chunk_size_;

            status = LoadCurrent(index);
            if (!status.ok()) {
                break;
            }

            size_t take = std::min(target - position_, chunk_size_ - offset);
            SpliceChunk(current_, offset, zeros, 0, take);
            dirty_ = true;

            position_ += take;
            extent_ = std::max(extent_, position_);
        }
    } catch (const std::exception& e) {
        std::cerr << "ChunkedStream: Failed to zero-fill '" << file_name_ << "' up to "
                  << target << ": " << e.what() << std::endl;
        status = grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED,
                              "cannot zero-fill '" + file_name_ + "' up to " +
                              std::to_string(target) + ": " + e.what());
    }

    if (!status.ok()) {
        position_ = saved_position;
    }
    return status;
}

grpc::Status ChunkedStream::Write(const std::string& data) {
    if (mode_ == OpenMode::kRead) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                            "write not permitted: file '" + file_name_ +
                            "' is open in mode r");
    }
    if (data.empty()) {
        return grpc::Status::OK;
    }
    if (position_ > MaxLength() - data.size()) {
        return CheckLength(MaxLength() + 1);
    }

    grpc::Status status = FillTo(position_);
    if (!status.ok()) {
        return status;
    }
    try {
        return WriteAtPosition(data);
    } catch (const std::exception& e) {
        std::cerr << "ChunkedStream: Failed to write " << data.size() << " bytes to '"
                  << file_name_ << "': " << e.what() << std::endl;
        return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED,
                            "cannot write to '" + file_name_ + "': " + e.what());
    }
}

grpc::Status ChunkedStream::Seek(int64_t offset, SeekWhence whence) {
    int64_t base = 0;
    switch (whence) {
        case SeekWhence::kSet: base = 0; break;
        case SeekWhence::kCurrent: base = static_cast<int64_t>(position_); break;
        case SeekWhence::kEnd: base = static_cast<int64_t>(extent_); break;
    }

    if ((offset > 0 && base > INT64_MAX - offset) ||
        (offset < 0 && base < INT64_MIN - offset)) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "cannot seek '" + file_name_ + "' by " + std::to_string(offset) +
                            " from " + std::to_string(base) + ": offset overflows");
    }

    int64_t target = base + offset;
    if (target < 0) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "cannot seek '" + file_name_ + "' to negative offset " +
                            std::to_string(target));
    }
    if (mode_ == OpenMode::kRead && static_cast<uint64_t>(target) > extent_) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "cannot seek '" + file_name_ + "' to offset " +
                            std::to_string(target) + " past its length " +
                            std::to_string(extent_));
    }
    position_ = static_cast<uint64_t>(target);
    return grpc::Status::OK;
}

grpc::Status ChunkedStream::Rewind() {
    return Seek(0, SeekWhence::kSet);
}

grpc::Status ChunkedStream::SetChunkSize(uint64_t chunk_size) {
    if (mode_ == OpenMode::kRead || materialized_) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                            "chunk size change not permitted: can only change chunk size "
                            "if not already written to (file '" + file_name_ +
                            "', mode " + OpenModeToken(mode_) + ", requested " +
                            std::to_string(chunk_size) + ")");
    }
    if (chunk_size == 0) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "chunk size must be positive (file '" + file_name_ + "')");
    }
    chunk_size_ = chunk_size;
    return grpc::Status::OK;
}

grpc::Status ChunkedStream::TruncateTo(uint64_t length) {
    uint64_t old_chunks = ChunkCount(extent_);
    uint64_t new_chunks = ChunkCount(length);

    // An unsaved chunk past the new end is simply dropped
    if (current_index_ && *current_index_ >= new_chunks) {
        current_index_.reset();
        current_.clear();
        dirty_ = false;
    }

    if (length > 0) {
        uint64_t last = new_chunks - 1;
        uint64_t last_length = length - last * chunk_size_;

        grpc::Status status = LoadCurrent(last);
        if (!status.ok()) {
            return status;
        }
        if (current_.size() > last_length) {
            current_.resize(last_length);
            dirty_ = true;
        }
    }

    grpc::Status status = SaveCurrent();
    if (!status.ok()) {
        return status;
    }

    if (old_chunks > new_chunks) {
        status = store_.DeleteChunksFrom(file_id_, new_chunks, old_chunks);
        if (!status.ok()) {
            return status;
        }
        std::cout << "ChunkedStream: Truncated '" << file_name_ << "' from " << old_chunks
                  << " to " << new_chunks << " chunk(s)" << std::endl;
    }
    extent_ = length;
    return grpc::Status::OK;
}

grpc::Status ChunkedStream::Flush(uint64_t& out_length) {
    grpc::Status status;
    switch (mode_) {
        case OpenMode::kRead:
            out_length = extent_;
            return grpc::Status::OK;

        case OpenMode::kModify:
            status = SaveCurrent();
            if (status.ok()) {
                out_length = extent_;
            }
            return status;

        case OpenMode::kWrite: {
            uint64_t final_length = position_;
            status = FillTo(final_length);
            if (!status.ok()) {
                return status;
            }
            status = TruncateTo(final_length);
            if (status.ok()) {
                position_ = final_length;
                out_length = final_length;
            }
            return status;
        }
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, "unknown open mode");
}

}  // namespace gridstore_client
