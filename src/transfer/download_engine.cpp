#include "fileshare/transfer/download_engine.h"
#include "fileshare/base/error_code.h"
#include "fileshare/base/logger.h"
#include "fileshare/http/message.h"
#include "fileshare/http/range.h"
#include "fileshare/util/fs_utils.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace fileshare {

namespace {

elio::coro::task<bool> write_text(OutputStream& out, const std::string& text) {
    co_return co_await out.write(text.data(), text.size());
}

elio::coro::task<bool> flush_archive(ZipWriter& zip, OutputStream& out) {
    auto bytes = zip.take_pending();
    if (bytes.empty()) {
        co_return true;
    }
    co_return co_await out.write(bytes.data(), bytes.size());
}

HttpResponse attachment_head(uint16_t status, const std::string& content_type,
                             const std::string& filename) {
    HttpResponse response(status, content_type, "");
    response.set_header("Content-Disposition", "attachment; filename=" + quote_header_value(filename));
    return response;
}

} // anonymous namespace

DownloadEngine::DownloadEngine(std::shared_ptr<TransferSession> session)
    : session_(std::move(session)),
      chunk_size_(session_->config().chunk_size > 0 ? session_->config().chunk_size : 64 * 1024),
      zip_method_(parse_zip_method(session_->config().archive_compression).value_or(ZipMethod::Store)),
      deflate_level_(session_->config().deflate_level) {}

elio::coro::task<TransferOutcome> DownloadEngine::serve(OutputStream& out,
                                                        const std::string& peer_id,
                                                        const std::string& range_header) {
    std::error_code ec;
    if (std::filesystem::is_directory(session_->target_path(), ec)) {
        co_return co_await send_directory(out, peer_id);
    }
    if (!range_header.empty()) {
        co_return co_await send_range(out, peer_id, range_header);
    }
    co_return co_await send_file(out, peer_id);
}

elio::coro::task<TransferOutcome> DownloadEngine::send_file(OutputStream& out,
                                                            const std::string& peer_id) {
    const auto& path = session_->target_path();

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        co_await write_text(out, serialize_response(error_response(404, "File not found")));
        co_return TransferOutcome::rejected("stat " + path.string() + ": " + ec.message());
    }
    auto modified = std::filesystem::last_write_time(path, ec);

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::string reason = std::strerror(errno);
        co_await write_text(out, serialize_response(error_response(500, "Failed to open file")));
        co_return TransferOutcome::rejected("open " + path.string() + ": " + reason);
    }

    uint64_t attempt = session_->begin_transfer(size);
    session_->add_log("Started download from " + peer_id);

    HttpResponse head = attachment_head(200, "application/octet-stream",
                                        session_->snapshot().target_name);
    head.set_header("Content-Length", std::to_string(size));
    head.set_header("Accept-Ranges", "bytes");
    if (!ec) {
        head.set_header("Last-Modified", http_date(modified));
    }

    if (!co_await write_text(out, serialize_streamed_head(std::move(head)))) {
        session_->fail_transfer(attempt, out.error_message());
        co_return TransferOutcome::failed(0, out.error_message());
    }

    std::vector<char> buffer(chunk_size_);
    uint64_t sent = 0;

    while (sent < size) {
        if (!session_->is_current(attempt)) {
            Logger::instance().debug("Download for {} superseded after {} bytes", peer_id, sent);
            co_return TransferOutcome::cancelled(sent);
        }

        size_t want = static_cast<size_t>(std::min<uint64_t>(chunk_size_, size - sent));
        file.read(buffer.data(), static_cast<std::streamsize>(want));
        auto got = file.gcount();
        if (got <= 0) {
            std::string message = file.bad() ? "read error on " + path.string()
                                             : "file shrank during download: " + path.string();
            session_->fail_transfer(attempt, message);
            co_return TransferOutcome::failed(sent, message);
        }

        if (!co_await out.write(buffer.data(), static_cast<size_t>(got))) {
            session_->fail_transfer(attempt, out.error_message());
            co_return TransferOutcome::failed(sent, out.error_message());
        }

        sent += static_cast<uint64_t>(got);
        session_->report_progress(attempt, sent);
    }

    if (!session_->complete_transfer(attempt)) {
        co_return TransferOutcome::cancelled(sent);
    }
    session_->add_log("Download completed for " + peer_id);
    co_return TransferOutcome::completed(sent);
}

elio::coro::task<TransferOutcome> DownloadEngine::send_range(OutputStream& out,
                                                             const std::string& peer_id,
                                                             const std::string& range_header) {
    const auto& path = session_->target_path();

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        co_await write_text(out, serialize_response(error_response(404, "File not found")));
        co_return TransferOutcome::rejected("stat " + path.string() + ": " + ec.message());
    }

    RangeRequest request = parse_range_header(range_header, size);
    if (request.kind == RangeKind::None) {
        co_return co_await send_file(out, peer_id);
    }

    if (request.kind == RangeKind::Unsatisfiable) {
        HttpResponse response(416, "text/plain", "");
        response.set_header("Content-Range", unsatisfied_range(size));
        co_await write_text(out, serialize_response(std::move(response)));
        co_return TransferOutcome::rejected("range not satisfiable: " + range_header);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::string reason = std::strerror(errno);
        co_await write_text(out, serialize_response(error_response(500, "Failed to open file")));
        co_return TransferOutcome::rejected("open " + path.string() + ": " + reason);
    }
    file.seekg(static_cast<std::streamoff>(request.range.first));

    const ByteRange range = request.range;
    session_->add_log("Range request from " + peer_id + ": " + content_range(range, size));

    HttpResponse head = attachment_head(206, "application/octet-stream",
                                        session_->snapshot().target_name);
    head.set_header("Content-Length", std::to_string(range.length()));
    head.set_header("Content-Range", content_range(range, size));
    head.set_header("Accept-Ranges", "bytes");
    auto modified = std::filesystem::last_write_time(path, ec);
    if (!ec) {
        head.set_header("Last-Modified", http_date(modified));
    }

    if (!co_await write_text(out, serialize_streamed_head(std::move(head)))) {
        co_return TransferOutcome::failed(0, out.error_message());
    }

    std::vector<char> buffer(chunk_size_);
    uint64_t remaining = range.length();
    uint64_t sent = 0;

    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(chunk_size_, remaining));
        file.read(buffer.data(), static_cast<std::streamsize>(want));
        auto got = file.gcount();
        if (got <= 0) {
            co_return TransferOutcome::failed(sent, "read error on " + path.string());
        }
        if (!co_await out.write(buffer.data(), static_cast<size_t>(got))) {
            co_return TransferOutcome::failed(sent, out.error_message());
        }
        sent += static_cast<uint64_t>(got);
        remaining -= static_cast<uint64_t>(got);
    }

    co_return TransferOutcome::completed(sent);
}

elio::coro::task<TransferOutcome> DownloadEngine::send_directory(OutputStream& out,
                                                                 const std::string& peer_id) {
    const auto root = session_->target_path();

    uint64_t total = calculate_dir_size(root);
    uint64_t attempt = session_->begin_transfer(total);
    session_->add_log("Started download from " + peer_id);

    HttpResponse head = attachment_head(200, "application/zip",
                                        session_->snapshot().target_name + ".zip");
    if (!co_await write_text(out, serialize_streamed_head(std::move(head)))) {
        session_->fail_transfer(attempt, out.error_message());
        co_return TransferOutcome::failed(0, out.error_message());
    }

    ZipWriter zip(zip_method_, deflate_level_);
    std::vector<char> buffer(chunk_size_);
    uint64_t archived = 0;
    std::string failure;

    try {
        std::error_code ec;
        std::filesystem::recursive_directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        std::filesystem::recursive_directory_iterator end;
        if (ec) {
            failure = "cannot read directory " + root.string() + ": " + ec.message();
        }

        while (failure.empty() && it != end) {
            if (!session_->is_current(attempt)) {
                Logger::instance().debug("Archive for {} superseded after {} bytes", peer_id, archived);
                co_return TransferOutcome::cancelled(archived);
            }

            const auto entry = *it;
            std::string name = entry.path().lexically_relative(root).generic_string();
            std::error_code entry_ec;

            if (entry.is_directory(entry_ec)) {
                auto modified = entry.last_write_time(entry_ec);
                zip.add_directory(name, entry_ec ? 0 : file_time_to_time_t(modified));
            } else if (entry.is_regular_file(entry_ec)) {
                std::ifstream file(entry.path(), std::ios::binary);
                if (!file) {
                    failure = "open " + entry.path().string() + ": " + std::strerror(errno);
                    break;
                }
                uint64_t size_hint = entry.file_size(entry_ec);
                auto modified = entry.last_write_time(entry_ec);
                zip.begin_file(name, entry_ec ? 0 : file_time_to_time_t(modified), size_hint);

                uint64_t file_bytes = 0;
                while (true) {
                    if (!session_->is_current(attempt)) {
                        co_return TransferOutcome::cancelled(archived + file_bytes);
                    }
                    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                    auto got = file.gcount();
                    if (got > 0) {
                        zip.write_data(buffer.data(), static_cast<size_t>(got));
                        file_bytes += static_cast<uint64_t>(got);
                        if (!co_await flush_archive(zip, out)) {
                            failure = out.error_message();
                            break;
                        }
                    }
                    if (file.bad()) {
                        failure = "read error on " + entry.path().string();
                        break;
                    }
                    if (file.eof() || got <= 0) {
                        break;
                    }
                }
                if (!failure.empty()) {
                    break;
                }

                zip.end_file();
                archived += file_bytes;
                session_->report_progress(attempt, archived);
            }

            if (!co_await flush_archive(zip, out)) {
                failure = out.error_message();
                break;
            }

            it.increment(ec);
            if (ec) {
                failure = "directory walk failed: " + ec.message();
            }
        }

        if (failure.empty()) {
            zip.finish();
            if (!co_await flush_archive(zip, out)) {
                failure = out.error_message();
            }
        }
    } catch (const FileShareError& e) {
        failure = e.what();
    } catch (const std::filesystem::filesystem_error& e) {
        failure = e.what();
    }

    if (!failure.empty()) {
        session_->fail_transfer(attempt, failure);
        co_return TransferOutcome::failed(archived, failure);
    }

    if (!session_->complete_transfer(attempt)) {
        co_return TransferOutcome::cancelled(archived);
    }
    session_->add_log("Download completed for " + peer_id);
    co_return TransferOutcome::completed(archived);
}

} // namespace fileshare
