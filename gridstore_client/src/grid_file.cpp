#include "gridstore_client/grid_file.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace gridstore_client {

namespace {

constexpr uint64_t kLineReadSize = 256;

int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

grpc::Status ValidateName(const std::string& name, const std::string& root) {
    if (name.empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "file name cannot be empty");
    }
    if (root.empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "root cannot be empty (file '" + name + "')");
    }
    return grpc::Status::OK;
}

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

std::vector<std::string> SplitLines(const std::string& data, char separator) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < data.size()) {
        size_t end = data.find(separator, start);
        if (end == std::string::npos) {
            lines.push_back(data.substr(start));
            break;
        }
        lines.push_back(data.substr(start, end - start + 1));
        start = end + 1;
    }
    return lines;
}

// ============================================================================
// Open / Close
// ============================================================================

grpc::Status GridFile::Open(const Database& db, const std::string& name,
                            const std::string& mode, const OpenOptions& options,
                            std::unique_ptr<GridFile>& out_file) {
    OpenMode parsed;
    grpc::Status status = ParseOpenMode(mode, parsed);
    if (!status.ok()) {
        return status;
    }
    return Open(db, name, parsed, options, out_file);
}

grpc::Status GridFile::Open(const Database& db, const std::string& name, OpenMode mode,
                            const OpenOptions& options, std::unique_ptr<GridFile>& out_file) {
    grpc::Status status = ValidateName(name, options.root);
    if (!status.ok()) {
        return status;
    }
    if (!db.valid()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "cannot open '" + name + "': database handle not initialized");
    }

    auto chunks = std::make_unique<ChunkStore>(db.GetCollection(options.root + ".chunks"));
    auto records = std::make_unique<FileRecordStore>(
        db.GetCollection(options.root + ".files"), options.root);

    FileRecord record;
    bool is_new = false;

    if (mode == OpenMode::kWrite) {
        is_new = true;
    } else {
        status = records->FindLatestByName(name, record);
        if (status.error_code() == grpc::StatusCode::NOT_FOUND && mode == OpenMode::kModify) {
            is_new = true;
        } else if (!status.ok()) {
            return status;
        }
    }

    if (is_new) {
        record = FileRecord();
        record.id = IdGenerator::NewId();
        record.name = name;
        record.root = options.root;
        record.upload_date_ms = NowMillis();
        status = records->NextVersion(name, record.version);
        if (!status.ok()) {
            return status;
        }
    }

    if (mode != OpenMode::kRead) {
        if (options.content_type) {
            record.content_type = *options.content_type;
        }
        if (options.metadata) {
            record.metadata = *options.metadata;
        }
    }

    std::unique_ptr<GridFile> file(
        new GridFile(record, is_new, mode, std::move(chunks), std::move(records)));

    if (options.chunk_size) {
        status = file->SetChunkSize(*options.chunk_size);
        if (!status.ok()) {
            // Nothing was written yet; closing would only persist an empty record
            file->closed_ = true;
            return status;
        }
    }

    std::cout << "GridFile: Opened '" << name << "' in root '" << options.root
              << "' mode " << OpenModeToken(mode) << " (id " << file->id() << ", "
              << file->length() << " bytes)" << std::endl;

    out_file = std::move(file);
    return grpc::Status::OK;
}

GridFile::GridFile(FileRecord record, bool is_new, OpenMode mode,
                   std::unique_ptr<ChunkStore> chunks, std::unique_ptr<FileRecordStore> records)
    : record_(std::move(record)),
      is_new_(is_new),
      mode_(mode),
      chunks_(std::move(chunks)),
      records_(std::move(records)) {
    stream_ = std::make_unique<ChunkedStream>(*chunks_, record_.id, record_.name, mode_,
                                              record_.chunk_size,
                                              is_new_ ? 0 : record_.length);
}

GridFile::~GridFile() {
    if (closed_) {
        return;
    }
    try {
        grpc::Status status = Close();
        if (!status.ok()) {
            std::cerr << "GridFile: Failed to close '" << record_.name << "': "
                      << status.error_message() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "GridFile: Error closing '" << record_.name << "': " << e.what()
                  << std::endl;
    }
}

grpc::Status GridFile::Close() {
    if (closed_) {
        return grpc::Status::OK;
    }
    closed_ = true;

    uint64_t length = 0;
    grpc::Status status = stream_->Flush(length);
    if (!status.ok()) {
        std::cerr << "GridFile: Flush failed for '" << record_.name << "': "
                  << status.error_message() << std::endl;
        return status;
    }

    if (mode_ == OpenMode::kRead) {
        return grpc::Status::OK;
    }

    record_.length = length;
    record_.chunk_size = stream_->chunk_size();
    status = ComputeMd5(length, record_.md5);
    if (!status.ok()) {
        return status;
    }

    status = is_new_ ? records_->Insert(record_) : records_->Update(record_);
    if (!status.ok()) {
        return status;
    }

    std::cout << "GridFile: Closed '" << record_.name << "' (" << record_.length
              << " bytes, chunk size " << record_.chunk_size << ", md5 " << record_.md5
              << ")" << std::endl;
    return grpc::Status::OK;
}

grpc::Status GridFile::ComputeMd5(uint64_t length, std::string& out_hex) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return grpc::Status(grpc::StatusCode::INTERNAL, "failed to initialize MD5 digest");
    }

    uint64_t chunk_size = stream_->chunk_size();
    uint64_t count = (length + chunk_size - 1) / chunk_size;
    for (uint64_t index = 0; index < count; ++index) {
        std::string payload;
        grpc::Status status = chunks_->LoadChunk(record_.id, index, payload);
        if (!status.ok()) {
            return status;
        }
        EVP_DigestUpdate(ctx.get(), payload.data(), payload.size());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        return grpc::Status(grpc::StatusCode::INTERNAL, "failed to finalize MD5 digest");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < digest_length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)digest[i];
    }
    out_hex = ss.str();
    return grpc::Status::OK;
}

// ============================================================================
// Stream operations
// ============================================================================

grpc::Status GridFile::CheckOpen() const {
    if (closed_) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                            "file '" + record_.name + "' is closed");
    }
    return grpc::Status::OK;
}

grpc::Status GridFile::CheckMutable(const char* attribute) const {
    grpc::Status status = CheckOpen();
    if (!status.ok()) {
        return status;
    }
    if (mode_ == OpenMode::kRead) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                            std::string("cannot change ") + attribute + " of '" +
                            record_.name + "': file is open in mode r");
    }
    return grpc::Status::OK;
}

grpc::Status GridFile::Read(uint64_t n, std::string& out_data) {
    grpc::Status status = CheckOpen();
    if (!status.ok()) {
        return status;
    }
    return stream_->Read(n, out_data);
}

grpc::Status GridFile::Read(std::string& out_data) {
    grpc::Status status = CheckOpen();
    if (!status.ok()) {
        return status;
    }
    return stream_->ReadToEnd(out_data);
}

grpc::Status GridFile::Write(const std::string& data) {
    grpc::Status status = CheckOpen();
    if (!status.ok()) {
        return status;
    }
    return stream_->Write(data);
}

grpc::Status GridFile::Seek(int64_t offset, SeekWhence whence) {
    grpc::Status status = CheckOpen();
    if (!status.ok()) {
        return status;
    }
    return stream_->Seek(offset, whence);
}

grpc::Status GridFile::Rewind() {
    grpc::Status status = CheckOpen();
    if (!status.ok()) {
        return status;
    }
    return stream_->Rewind();
}

grpc::Status GridFile::Puts(const std::string& line) {
    if (!line.empty() && line.back() == '\n') {
        return Write(line);
    }
    return Write(line + "\n");
}

grpc::Status GridFile::ReadLine(std::string& out_line) {
    out_line.clear();
    grpc::Status status = CheckOpen();
    if (!status.ok()) {
        return status;
    }

    std::string piece;
    while (!stream_->Eof()) {
        status = stream_->Read(kLineReadSize, piece);
        if (!status.ok()) {
            return status;
        }
        size_t newline = piece.find('\n');
        if (newline != std::string::npos) {
            out_line.append(piece, 0, newline + 1);
            // Step back over what was read past the line end
            int64_t overshoot = static_cast<int64_t>(piece.size() - newline - 1);
            return stream_->Seek(-overshoot, SeekWhence::kCurrent);
        }
        out_line += piece;
    }
    return grpc::Status::OK;
}

grpc::Status GridFile::ReadLines(std::vector<std::string>& out_lines) {
    std::string data;
    grpc::Status status = Read(data);
    if (!status.ok()) {
        return status;
    }
    out_lines = SplitLines(data);
    return grpc::Status::OK;
}

// ============================================================================
// Record attributes
// ============================================================================

grpc::Status GridFile::SetChunkSize(uint64_t chunk_size) {
    grpc::Status status = CheckOpen();
    if (!status.ok()) {
        return status;
    }
    return stream_->SetChunkSize(chunk_size);
}

grpc::Status GridFile::SetContentType(const std::string& content_type) {
    grpc::Status status = CheckMutable("content type");
    if (!status.ok()) {
        return status;
    }
    record_.content_type = content_type;
    return grpc::Status::OK;
}

grpc::Status GridFile::SetMetadata(const Document& metadata) {
    grpc::Status status = CheckMutable("metadata");
    if (!status.ok()) {
        return status;
    }
    record_.metadata = metadata;
    return grpc::Status::OK;
}

std::chrono::system_clock::time_point GridFile::upload_date() const {
    return std::chrono::system_clock::time_point(
        std::chrono::milliseconds(record_.upload_date_ms));
}

}  // namespace gridstore_client
