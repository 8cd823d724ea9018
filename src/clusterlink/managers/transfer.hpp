#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <clusterlink/core/types.hpp>
#include "executor.hpp"
#include "retry.hpp"

namespace clusterlink {

namespace fs = std::filesystem;

struct TransferSettings {
    std::size_t chunk_size = TRANSFER_CHUNK_SIZE;
    int chunk_timeout = CHUNK_TIMEOUT_SECS;     // one chunk write + flush
    int quick_timeout = QUICK_TIMEOUT_SECS;     // stat, open, mkdir, small files
    RetryPolicy chunk_retry = RetryPolicy::files();
    RetryPolicy quick_retry = RetryPolicy::quick();
};

struct UploadItem {
    fs::path local_path;
    std::string remote_path;
};

struct UploadFailure {
    std::string file;
    Error error;
};

struct BatchUploadReport {
    std::vector<std::string> uploaded;
    std::vector<UploadFailure> failed;

    bool all_succeeded() const { return failed.empty(); }
};

// Chunked SFTP transfers. Every chunk takes the session lease on its own,
// gets its own timeout and retry budget, and is flushed before the next one.
// A failed transfer leaves the partial remote file where it is.
class TransferEngine {
public:
    TransferEngine(Executor& executor, TransferSettings settings);

    // Returns the number of bytes written.
    Result<uint64_t> upload(const fs::path& local, const std::string& remote,
                            ProgressCallback progress = nullptr);

    Result<uint64_t> download(const std::string& remote, const fs::path& local,
                              ProgressCallback progress = nullptr);

    // Keeps going past individual failures.
    BatchUploadReport upload_batch(const std::vector<UploadItem>& items,
                                   ProgressCallback progress = nullptr);

    Result<std::vector<RemoteFileInfo>> list_directory(const std::string& path);
    Result<void> create_directory(const std::string& path);
    Result<bool> exists(const std::string& path);
    Result<RemoteFileInfo> stat(const std::string& path);

    // Whole small files (up to MAX_TEXT_FILE_SIZE).
    Result<std::string> read_text(const std::string& path);
    Result<void> write_text(const std::string& path, const std::string& content);

    const TransferSettings& settings() const { return settings_; }

private:
    // Exhausted timeouts mean the session is gone.
    void note_failure(const Error& err);

    Executor& executor_;
    TransferSettings settings_;
};

} // namespace clusterlink
