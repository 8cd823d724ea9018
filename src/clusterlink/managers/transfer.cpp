#include "transfer.hpp"
#include <clusterlink/core/log.hpp>
#include <clusterlink/core/validation.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <memory>

namespace clusterlink {

using SharedFile = std::shared_ptr<RemoteFile>;

static TransferProgress make_progress(const std::string& name, uint64_t done, uint64_t total) {
    TransferProgress p;
    p.file_name = name;
    p.bytes_transferred = done;
    p.total_bytes = total;
    p.percentage = total == 0 ? 100.0 : (static_cast<double>(done) * 100.0) / static_cast<double>(total);
    return p;
}

// A filesystem failure mid-transfer is reported as an interrupted transfer
static Error interrupted(Error err) {
    if (err.kind == ErrorKind::FileSystem && err.code != "FILE_003") err.code = "FILE_002";
    return err;
}

static std::string base_name(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

TransferEngine::TransferEngine(Executor& executor, TransferSettings settings)
    : executor_(executor), settings_(std::move(settings)) {
    if (settings_.chunk_size == 0) settings_.chunk_size = TRANSFER_CHUNK_SIZE;
}

void TransferEngine::note_failure(const Error& err) {
    if (err.kind == ErrorKind::Timeout) {
        executor_.connection().report_failure(err, true);
    }
}

// ── Upload ──────────────────────────────────────────────────

Result<uint64_t> TransferEngine::upload(const fs::path& local, const std::string& remote,
                                        ProgressCallback progress) {
    using R = Result<uint64_t>;

    std::error_code ec;
    if (!fs::exists(local, ec)) {
        return R::Err(make_error(ErrorKind::FileSystem, "Local file not found: " + local.string(), "FILE_001"));
    }
    if (!fs::is_regular_file(local, ec)) {
        return R::Err(make_error(ErrorKind::FileSystem, "Not a regular file: " + local.string(), "FILE_001"));
    }
    auto valid = validate_remote_path(remote);
    if (valid.is_err()) return R::Err(valid.error);

    uint64_t total = fs::file_size(local, ec);
    if (ec) {
        return R::Err(make_error(ErrorKind::FileSystem,
                                 fmt::format("Cannot stat {}: {}", local.string(), ec.message())));
    }
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return R::Err(make_error(ErrorKind::FileSystem, "Cannot read file: " + local.string()));
    }

    std::string name = local.filename().string();
    int chunk_timeout = settings_.chunk_timeout;
    cl_log(fmt::format("upload: {} -> {} ({} bytes, chunk {})", local.string(), remote, total,
                       settings_.chunk_size));

    auto opened = with_retry<SharedFile>(settings_.quick_retry, [&]() {
        return executor_.with_transport<SharedFile>(
            "upload:open", chunk_timeout, [remote, chunk_timeout](RemoteTransport& t) {
                auto f = t.open_file(remote, OpenMode::Write, chunk_timeout);
                if (f.is_err()) return Result<SharedFile>::Err(f.error);
                return Result<SharedFile>::Ok(SharedFile(std::move(f.value)));
            });
    }, nullptr, executor_.retry_hooks());
    if (opened.is_err()) {
        note_failure(opened.error);
        return R::Err(opened.error);
    }
    SharedFile file = opened.value;

    uint64_t offset = 0;
    while (offset < total) {
        auto chunk = std::make_shared<std::string>();
        chunk->resize(static_cast<std::size_t>(std::min<uint64_t>(settings_.chunk_size, total - offset)));
        in.read(&(*chunk)[0], static_cast<std::streamsize>(chunk->size()));
        if (static_cast<std::size_t>(in.gcount()) != chunk->size()) {
            return R::Err(make_error(ErrorKind::FileSystem,
                                     fmt::format("Short read from {} at offset {}", local.string(), offset)));
        }

        // A retried chunk is rewritten at the same offset
        auto written = with_retry<void>(settings_.chunk_retry, [&]() {
            return executor_.with_transport<void>(
                "upload:chunk", chunk_timeout, [file, chunk, offset](RemoteTransport&) {
                    auto s = file->seek(offset);
                    if (s.is_err()) return s;
                    auto w = file->write(chunk->data(), chunk->size());
                    if (w.is_err()) return w;
                    return file->flush();
                });
        }, nullptr, executor_.retry_hooks());

        if (written.is_err()) {
            Error err = interrupted(written.error);
            err.details = fmt::format("partial remote file {} holds {} of {} bytes", remote, offset, total);
            cl_log_error("upload", err);
            note_failure(err);
            return R::Err(err);
        }

        offset += chunk->size();
        if (progress) progress(make_progress(name, offset, total));
    }
    if (total == 0 && progress) progress(make_progress(name, 0, 0));

    auto closed = executor_.with_transport<void>(
        "upload:close", chunk_timeout, [file](RemoteTransport&) { return file->close(); });
    if (closed.is_err()) {
        cl_log_error("upload:close", closed.error);
        return R::Err(closed.error);
    }

    cl_log(fmt::format("upload: {} complete", remote));
    return R::Ok(total);
}

BatchUploadReport TransferEngine::upload_batch(const std::vector<UploadItem>& items,
                                               ProgressCallback progress) {
    BatchUploadReport report;
    for (const auto& item : items) {
        auto r = upload(item.local_path, item.remote_path, progress);
        if (r.is_ok()) {
            report.uploaded.push_back(item.remote_path);
        } else {
            report.failed.push_back({item.local_path.string(), r.error});
        }
    }
    cl_log(fmt::format("upload_batch: {} uploaded, {} failed", report.uploaded.size(), report.failed.size()));
    return report;
}

// ── Download ────────────────────────────────────────────────

Result<uint64_t> TransferEngine::download(const std::string& remote, const fs::path& local,
                                          ProgressCallback progress) {
    using R = Result<uint64_t>;

    auto info = stat(remote);
    if (info.is_err()) return R::Err(info.error);
    if (info.value.is_directory) {
        return R::Err(make_error(ErrorKind::FileSystem, "Is a directory: " + remote));
    }
    uint64_t total = info.value.size;

    std::error_code ec;
    if (local.has_parent_path()) fs::create_directories(local.parent_path(), ec);
    if (ec) {
        return R::Err(make_error(ErrorKind::FileSystem,
                                 fmt::format("Cannot create {}: {}", local.parent_path().string(), ec.message())));
    }
    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        return R::Err(make_error(ErrorKind::FileSystem, "Cannot write file: " + local.string()));
    }

    int chunk_timeout = settings_.chunk_timeout;
    std::size_t chunk_size = settings_.chunk_size;
    cl_log(fmt::format("download: {} -> {} ({} bytes)", remote, local.string(), total));

    auto opened = with_retry<SharedFile>(settings_.quick_retry, [&]() {
        return executor_.with_transport<SharedFile>(
            "download:open", chunk_timeout, [remote, chunk_timeout](RemoteTransport& t) {
                auto f = t.open_file(remote, OpenMode::Read, chunk_timeout);
                if (f.is_err()) return Result<SharedFile>::Err(f.error);
                return Result<SharedFile>::Ok(SharedFile(std::move(f.value)));
            });
    }, nullptr, executor_.retry_hooks());
    if (opened.is_err()) {
        note_failure(opened.error);
        return R::Err(opened.error);
    }
    SharedFile file = opened.value;
    std::string name = base_name(remote);

    uint64_t offset = 0;
    for (;;) {
        auto chunk = with_retry<std::string>(settings_.chunk_retry, [&]() {
            return executor_.with_transport<std::string>(
                "download:chunk", chunk_timeout, [file, offset, chunk_size](RemoteTransport&) {
                    using RS = Result<std::string>;
                    auto s = file->seek(offset);
                    if (s.is_err()) return RS::Err(s.error);
                    std::string data(chunk_size, '\0');
                    std::size_t got = 0;
                    while (got < chunk_size) {
                        auto n = file->read(&data[got], chunk_size - got);
                        if (n.is_err()) return RS::Err(n.error);
                        if (n.value == 0) break;
                        got += n.value;
                    }
                    data.resize(got);
                    return RS::Ok(std::move(data));
                });
        }, nullptr, executor_.retry_hooks());

        if (chunk.is_err()) {
            Error err = interrupted(chunk.error);
            err.details = fmt::format("{} of {} bytes received", offset, total);
            cl_log_error("download", err);
            note_failure(err);
            return R::Err(err);
        }
        if (chunk.value.empty()) break;

        out.write(chunk.value.data(), static_cast<std::streamsize>(chunk.value.size()));
        if (!out) {
            return R::Err(make_error(ErrorKind::FileSystem, "Write failed: " + local.string()));
        }
        offset += chunk.value.size();
        if (progress) progress(make_progress(name, offset, std::max(total, offset)));
        if (chunk.value.size() < chunk_size) break;
    }
    if (offset == 0 && progress) progress(make_progress(name, 0, 0));

    out.close();
    auto closed = executor_.with_transport<void>(
        "download:close", chunk_timeout, [file](RemoteTransport&) { return file->close(); });
    if (closed.is_err()) cl_log_error("download:close", closed.error);

    cl_log(fmt::format("download: {} complete ({} bytes)", remote, offset));
    return R::Ok(offset);
}

// ── Small operations ────────────────────────────────────────

Result<RemoteFileInfo> TransferEngine::stat(const std::string& path) {
    auto valid = validate_remote_path(path);
    if (valid.is_err()) return Result<RemoteFileInfo>::Err(valid.error);

    return with_retry<RemoteFileInfo>(settings_.quick_retry, [&]() {
        return executor_.with_transport<RemoteFileInfo>(
            "stat", settings_.quick_timeout, [path](RemoteTransport& t) { return t.stat(path); });
    }, nullptr, executor_.retry_hooks());
}

Result<std::vector<RemoteFileInfo>> TransferEngine::list_directory(const std::string& path) {
    using R = Result<std::vector<RemoteFileInfo>>;
    auto valid = validate_remote_path(path);
    if (valid.is_err()) return R::Err(valid.error);

    return with_retry<std::vector<RemoteFileInfo>>(settings_.quick_retry, [&]() {
        return executor_.with_transport<std::vector<RemoteFileInfo>>(
            "list_directory", settings_.quick_timeout,
            [path](RemoteTransport& t) { return t.list_directory(path); });
    }, nullptr, executor_.retry_hooks());
}

Result<void> TransferEngine::create_directory(const std::string& path) {
    auto valid = validate_remote_path(path);
    if (valid.is_err()) return Result<void>::Err(valid.error);

    auto r = executor_.run_with_retry("mkdir -p -m 0755 " + escape_for_command(path),
                                      settings_.quick_timeout, settings_.quick_retry);
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<bool> TransferEngine::exists(const std::string& path) {
    auto info = stat(path);
    if (info.is_ok()) return Result<bool>::Ok(true);
    if (info.error.kind == ErrorKind::FileSystem && info.error.code == "FILE_001") {
        return Result<bool>::Ok(false);
    }
    return Result<bool>::Err(info.error);
}

Result<std::string> TransferEngine::read_text(const std::string& path) {
    using R = Result<std::string>;
    auto info = stat(path);
    if (info.is_err()) return R::Err(info.error);
    if (info.value.size > MAX_TEXT_FILE_SIZE) {
        return R::Err(make_error(ErrorKind::FileSystem,
                                 fmt::format("{} is too large to read as text ({} bytes)", path, info.value.size)));
    }

    int timeout = settings_.quick_timeout;
    return with_retry<std::string>(settings_.quick_retry, [&]() {
        return executor_.with_transport<std::string>("read_text", timeout, [path, timeout](RemoteTransport& t) {
            auto f = t.open_file(path, OpenMode::Read, timeout);
            if (f.is_err()) return R::Err(f.error);

            std::string content;
            char buf[SSH_READ_BUF_SIZE];
            for (;;) {
                auto n = f.value->read(buf, sizeof(buf));
                if (n.is_err()) return R::Err(n.error);
                if (n.value == 0) break;
                content.append(buf, n.value);
                if (content.size() > MAX_TEXT_FILE_SIZE) {
                    return R::Err(make_error(ErrorKind::FileSystem, path + " grew past the text size limit"));
                }
            }
            auto c = f.value->close();
            if (c.is_err()) return R::Err(c.error);
            return R::Ok(std::move(content));
        });
    }, nullptr, executor_.retry_hooks());
}

Result<void> TransferEngine::write_text(const std::string& path, const std::string& content) {
    auto valid = validate_remote_path(path);
    if (valid.is_err()) return Result<void>::Err(valid.error);

    int timeout = settings_.quick_timeout;
    return with_retry<void>(settings_.quick_retry, [&]() {
        return executor_.with_transport<void>("write_text", timeout, [path, content, timeout](RemoteTransport& t) {
            auto f = t.open_file(path, OpenMode::Write, timeout);
            if (f.is_err()) return Result<void>::Err(f.error);
            auto w = f.value->write(content.data(), content.size());
            if (w.is_err()) return w;
            auto fl = f.value->flush();
            if (fl.is_err()) return fl;
            return f.value->close();
        });
    }, nullptr, executor_.retry_hooks());
}

} // namespace clusterlink
