#pragma once

#include "gridstore_client/chunk_store.hpp"
#include "gridstore_client/chunked_stream.hpp"
#include "gridstore_client/connection.hpp"
#include "gridstore_client/file_record_store.hpp"
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gridstore_client {

struct OpenOptions {
    std::string root = kDefaultRoot;
    // The following apply to "w" and "w+" sessions only
    std::optional<uint64_t> chunk_size;
    std::optional<std::string> content_type;
    std::optional<Document> metadata;
};

// Split on separator, keeping it at the end of each line. A trailing
// fragment without separator is returned as-is.
std::vector<std::string> SplitLines(const std::string& data, char separator = '\n');

/**
 * GridFile: One open session on a stored file
 *
 * Open resolves or creates the file record and binds a ChunkedStream to
 * it. Close flushes the stream and writes the record, which is the single
 * commit point of the session:
 *   "w"   inserts a new record (new id, new upload date, next version)
 *   "w+"  updates the existing record in place, or inserts one if the
 *         name did not exist
 *   "r"   writes nothing
 *
 * The destructor closes a session that was not closed explicitly and logs
 * a failed close to stderr, so a GridFile held in a unique_ptr is flushed
 * on every exit path.
 *
 * Usage:
 *   std::unique_ptr<GridFile> file;
 *   grpc::Status s = GridFile::Open(db, "report.txt", "w", OpenOptions(), file);
 *   if (s.ok()) s = file->Write("hello");
 *   if (s.ok()) s = file->Close();
 */
class GridFile {
public:
    /**
     * @param mode "r", "w" or "w+"
     * @return INVALID_ARGUMENT for an unknown mode or an empty name/root,
     *         NOT_FOUND when opening a missing file for reading
     */
    static grpc::Status Open(const Database& db, const std::string& name,
                             const std::string& mode, const OpenOptions& options,
                             std::unique_ptr<GridFile>& out_file);
    static grpc::Status Open(const Database& db, const std::string& name, OpenMode mode,
                             const OpenOptions& options, std::unique_ptr<GridFile>& out_file);

    ~GridFile();
    GridFile(const GridFile&) = delete;
    GridFile& operator=(const GridFile&) = delete;

    // ========== Stream ==========
    grpc::Status Read(uint64_t n, std::string& out_data);
    grpc::Status Read(std::string& out_data);  // to end
    grpc::Status Write(const std::string& data);
    grpc::Status Seek(int64_t offset, SeekWhence whence = SeekWhence::kSet);
    grpc::Status Rewind();
    uint64_t Tell() const { return stream_->Tell(); }
    bool Eof() const { return stream_->Eof(); }

    // ========== Lines ==========
    // Writes line followed by '\n' unless it already ends with one
    grpc::Status Puts(const std::string& line);
    // Through the next '\n' (included) or to end; empty at end of file
    grpc::Status ReadLine(std::string& out_line);
    grpc::Status ReadLines(std::vector<std::string>& out_lines);

    // ========== Record attributes ==========
    grpc::Status SetChunkSize(uint64_t chunk_size);
    uint64_t chunk_size() const { return stream_->chunk_size(); }

    grpc::Status SetContentType(const std::string& content_type);
    const std::string& content_type() const { return record_.content_type; }

    grpc::Status SetMetadata(const Document& metadata);
    const std::optional<Document>& metadata() const { return record_.metadata; }

    std::chrono::system_clock::time_point upload_date() const;
    const std::string& name() const { return record_.name; }
    const std::string& id() const { return record_.id; }
    const std::string& root() const { return record_.root; }
    const std::string& md5() const { return record_.md5; }
    int64_t version() const { return record_.version; }
    uint64_t length() const { return stream_->Size(); }
    OpenMode mode() const { return mode_; }

    /**
     * Flush and persist the record. Later calls are no-ops. A failure is
     * returned as-is; the session counts as closed either way.
     */
    grpc::Status Close();
    bool closed() const { return closed_; }

private:
    GridFile(FileRecord record, bool is_new, OpenMode mode,
             std::unique_ptr<ChunkStore> chunks, std::unique_ptr<FileRecordStore> records);

    grpc::Status CheckOpen() const;
    grpc::Status CheckMutable(const char* attribute) const;
    grpc::Status ComputeMd5(uint64_t length, std::string& out_hex);

    FileRecord record_;
    bool is_new_;
    OpenMode mode_;
    std::unique_ptr<ChunkStore> chunks_;
    std::unique_ptr<FileRecordStore> records_;
    std::unique_ptr<ChunkedStream> stream_;
    bool closed_ = false;
};

}  // namespace gridstore_client
