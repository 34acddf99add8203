#include "fileshare/transfer/zip_writer.h"
#include "fileshare/base/error_code.h"
#include <zlib.h>
#include <algorithm>
#include <array>

namespace fileshare {

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t DATA_DESCRIPTOR_SIG = 0x08074b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t EOCD_SIG = 0x06054b50;
constexpr uint32_t EOCD64_SIG = 0x06064b50;
constexpr uint32_t EOCD64_LOCATOR_SIG = 0x07064b50;

constexpr uint16_t ZIP64_EXTRA_ID = 0x0001;
constexpr uint16_t FLAG_DATA_DESCRIPTOR = 0x0008;
constexpr uint16_t FLAG_UTF8 = 0x0800;
constexpr uint16_t METHOD_STORE = 0;
constexpr uint16_t METHOD_DEFLATE = 8;

constexpr uint16_t VERSION_DEFAULT = 20;
constexpr uint16_t VERSION_ZIP64 = 45;
constexpr uint16_t VERSION_MADE_BY = (3 << 8) | VERSION_ZIP64;  // unix

constexpr uint32_t MAX32 = 0xFFFFFFFF;
constexpr uint16_t MAX16 = 0xFFFF;

// Files whose size is this close to 4 GiB get ZIP64 local records, leaving
// room for deflate's worst-case expansion
constexpr uint64_t ZIP64_SIZE_HINT = 0xFFFF0000ull;

constexpr uint32_t FILE_ATTRIBUTES = 0100644u << 16;
constexpr uint32_t DIR_ATTRIBUTES = (040755u << 16) | 0x10;

constexpr size_t ZLIB_SLICE = 1u << 30;

void to_dos_time(std::time_t t, uint16_t& dos_time, uint16_t& dos_date) {
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    if (tm_buf.tm_year < 80) {
        dos_time = 0;
        dos_date = (1 << 5) | 1;  // 1980-01-01
        return;
    }
    dos_time = static_cast<uint16_t>((tm_buf.tm_hour << 11) |
                                     (tm_buf.tm_min << 5) |
                                     (tm_buf.tm_sec / 2));
    dos_date = static_cast<uint16_t>(((tm_buf.tm_year - 80) << 9) |
                                     ((tm_buf.tm_mon + 1) << 5) |
                                     tm_buf.tm_mday);
}

} // anonymous namespace

std::optional<ZipMethod> parse_zip_method(const std::string& name) {
    if (name == "store") return ZipMethod::Store;
    if (name == "deflate") return ZipMethod::Deflate;
    return std::nullopt;
}

struct ZipWriter::Deflater {
    z_stream strm{};
    bool active = false;

    ~Deflater() {
        if (active) {
            deflateEnd(&strm);
        }
    }
};

ZipWriter::ZipWriter(ZipMethod method, int deflate_level)
    : method_(method),
      deflate_level_(std::clamp(deflate_level, 0, 9)),
      deflater_(std::make_unique<Deflater>()) {}

ZipWriter::~ZipWriter() = default;

void ZipWriter::add_directory(const std::string& name, std::time_t modified) {
    if (in_file_ || finished_) {
        throw FileShareError(ErrorCode::ArchiveFailed, "directory added while an entry is open");
    }

    Entry entry;
    entry.name = name;
    if (entry.name.empty() || entry.name.back() != '/') {
        entry.name += '/';
    }
    entry.method = METHOD_STORE;
    entry.flags = FLAG_UTF8;
    entry.local_offset = offset_;
    entry.external_attributes = DIR_ATTRIBUTES;
    to_dos_time(modified, entry.dos_time, entry.dos_date);

    write_local_header(entry);
    entries_.push_back(std::move(entry));
}

void ZipWriter::begin_file(const std::string& name, std::time_t modified, uint64_t size_hint) {
    if (in_file_ || finished_) {
        throw FileShareError(ErrorCode::ArchiveFailed, "file added while an entry is open");
    }

    Entry entry;
    entry.name = name;
    entry.method = method_ == ZipMethod::Deflate ? METHOD_DEFLATE : METHOD_STORE;
    entry.flags = FLAG_UTF8 | FLAG_DATA_DESCRIPTOR;
    entry.crc = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));
    entry.local_offset = offset_;
    entry.external_attributes = FILE_ATTRIBUTES;
    entry.zip64_local = size_hint >= ZIP64_SIZE_HINT;
    to_dos_time(modified, entry.dos_time, entry.dos_date);

    if (method_ == ZipMethod::Deflate) {
        deflater_->strm = z_stream{};
        int ret = deflateInit2(&deflater_->strm, deflate_level_, Z_DEFLATED,
                               -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
        if (ret != Z_OK) {
            throw FileShareError(ErrorCode::ArchiveFailed,
                                 "deflateInit2 failed: " + std::to_string(ret));
        }
        deflater_->active = true;
    }

    write_local_header(entry);
    entries_.push_back(std::move(entry));
    in_file_ = true;
}

void ZipWriter::write_data(const void* data, size_t size) {
    if (!in_file_) {
        throw FileShareError(ErrorCode::ArchiveFailed, "data written outside a file entry");
    }

    Entry& entry = entries_.back();
    const auto* bytes = static_cast<const uint8_t*>(data);
    size_t remaining = size;

    while (remaining > 0) {
        size_t slice = std::min(remaining, ZLIB_SLICE);
        entry.crc = static_cast<uint32_t>(crc32(entry.crc, bytes, static_cast<uInt>(slice)));
        entry.uncompressed_size += slice;

        if (method_ == ZipMethod::Store) {
            append(bytes, slice);
            entry.compressed_size += slice;
        } else {
            z_stream& strm = deflater_->strm;
            strm.next_in = const_cast<Bytef*>(bytes);
            strm.avail_in = static_cast<uInt>(slice);

            std::array<uint8_t, 16384> out;
            do {
                strm.next_out = out.data();
                strm.avail_out = static_cast<uInt>(out.size());
                if (deflate(&strm, Z_NO_FLUSH) == Z_STREAM_ERROR) {
                    throw FileShareError(ErrorCode::ArchiveFailed, "deflate failed");
                }
                size_t have = out.size() - strm.avail_out;
                append(out.data(), have);
                entry.compressed_size += have;
            } while (strm.avail_out == 0);
        }

        bytes += slice;
        remaining -= slice;
    }
}

void ZipWriter::end_file() {
    if (!in_file_) {
        throw FileShareError(ErrorCode::ArchiveFailed, "no file entry is open");
    }

    Entry& entry = entries_.back();

    if (method_ == ZipMethod::Deflate) {
        z_stream& strm = deflater_->strm;
        strm.next_in = Z_NULL;
        strm.avail_in = 0;

        std::array<uint8_t, 16384> out;
        int ret = Z_OK;
        while (ret != Z_STREAM_END) {
            strm.next_out = out.data();
            strm.avail_out = static_cast<uInt>(out.size());
            ret = deflate(&strm, Z_FINISH);
            if (ret == Z_STREAM_ERROR) {
                throw FileShareError(ErrorCode::ArchiveFailed, "deflate finish failed");
            }
            size_t have = out.size() - strm.avail_out;
            append(out.data(), have);
            entry.compressed_size += have;
        }
        deflateEnd(&strm);
        deflater_->active = false;
    }

    bool sizes_overflow = entry.compressed_size >= MAX32 || entry.uncompressed_size >= MAX32;
    if (sizes_overflow && !entry.zip64_local) {
        throw FileShareError(ErrorCode::ArchiveFailed,
                             "entry grew past 4 GiB while streaming: " + entry.name);
    }

    put32(DATA_DESCRIPTOR_SIG);
    put32(entry.crc);
    if (entry.zip64_local) {
        put64(entry.compressed_size);
        put64(entry.uncompressed_size);
    } else {
        put32(static_cast<uint32_t>(entry.compressed_size));
        put32(static_cast<uint32_t>(entry.uncompressed_size));
    }

    in_file_ = false;
}

void ZipWriter::finish() {
    if (in_file_) {
        throw FileShareError(ErrorCode::ArchiveFailed, "archive finished with an open entry");
    }
    if (finished_) {
        return;
    }

    uint64_t cd_start = offset_;
    for (const auto& entry : entries_) {
        write_central_header(entry);
    }
    uint64_t cd_size = offset_ - cd_start;
    uint64_t count = entries_.size();

    if (count >= MAX16 || cd_size >= MAX32 || cd_start >= MAX32) {
        uint64_t eocd64_offset = offset_;
        put32(EOCD64_SIG);
        put64(44);  // remaining record size
        put16(VERSION_MADE_BY);
        put16(VERSION_ZIP64);
        put32(0);
        put32(0);
        put64(count);
        put64(count);
        put64(cd_size);
        put64(cd_start);

        put32(EOCD64_LOCATOR_SIG);
        put32(0);
        put64(eocd64_offset);
        put32(1);
    }

    put32(EOCD_SIG);
    put16(0);
    put16(0);
    put16(static_cast<uint16_t>(std::min<uint64_t>(count, MAX16)));
    put16(static_cast<uint16_t>(std::min<uint64_t>(count, MAX16)));
    put32(static_cast<uint32_t>(std::min<uint64_t>(cd_size, MAX32)));
    put32(static_cast<uint32_t>(std::min<uint64_t>(cd_start, MAX32)));
    put16(0);

    finished_ = true;
}

std::vector<uint8_t> ZipWriter::take_pending() {
    std::vector<uint8_t> out;
    out.swap(pending_);
    return out;
}

void ZipWriter::write_local_header(const Entry& entry) {
    put32(LOCAL_HEADER_SIG);
    put16(entry.zip64_local ? VERSION_ZIP64 : VERSION_DEFAULT);
    put16(entry.flags);
    put16(entry.method);
    put16(entry.dos_time);
    put16(entry.dos_date);
    put32(0);  // crc, sizes follow in the data descriptor
    put32(entry.zip64_local ? MAX32 : 0);
    put32(entry.zip64_local ? MAX32 : 0);
    put16(static_cast<uint16_t>(entry.name.size()));
    put16(entry.zip64_local ? 20 : 0);
    append(entry.name.data(), entry.name.size());

    if (entry.zip64_local) {
        put16(ZIP64_EXTRA_ID);
        put16(16);
        put64(0);
        put64(0);
    }
}

void ZipWriter::write_central_header(const Entry& entry) {
    bool big_uncompressed = entry.uncompressed_size >= MAX32;
    bool big_compressed = entry.compressed_size >= MAX32;
    bool big_offset = entry.local_offset >= MAX32;

    uint16_t extra_len = 0;
    if (big_uncompressed) extra_len += 8;
    if (big_compressed) extra_len += 8;
    if (big_offset) extra_len += 8;
    bool zip64 = extra_len > 0;

    put32(CENTRAL_HEADER_SIG);
    put16(VERSION_MADE_BY);
    put16(zip64 || entry.zip64_local ? VERSION_ZIP64 : VERSION_DEFAULT);
    put16(entry.flags);
    put16(entry.method);
    put16(entry.dos_time);
    put16(entry.dos_date);
    put32(entry.crc);
    put32(big_compressed ? MAX32 : static_cast<uint32_t>(entry.compressed_size));
    put32(big_uncompressed ? MAX32 : static_cast<uint32_t>(entry.uncompressed_size));
    put16(static_cast<uint16_t>(entry.name.size()));
    put16(zip64 ? static_cast<uint16_t>(extra_len + 4) : 0);
    put16(0);  // comment
    put16(0);  // disk number start
    put16(0);  // internal attributes
    put32(entry.external_attributes);
    put32(big_offset ? MAX32 : static_cast<uint32_t>(entry.local_offset));
    append(entry.name.data(), entry.name.size());

    if (zip64) {
        put16(ZIP64_EXTRA_ID);
        put16(extra_len);
        if (big_uncompressed) put64(entry.uncompressed_size);
        if (big_compressed) put64(entry.compressed_size);
        if (big_offset) put64(entry.local_offset);
    }
}

void ZipWriter::append(const void* data, size_t size) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    pending_.insert(pending_.end(), bytes, bytes + size);
    offset_ += size;
}

void ZipWriter::put16(uint16_t value) {
    uint8_t buf[2] = {
        static_cast<uint8_t>(value & 0xFF),
        static_cast<uint8_t>((value >> 8) & 0xFF)
    };
    append(buf, sizeof(buf));
}

void ZipWriter::put32(uint32_t value) {
    put16(static_cast<uint16_t>(value & 0xFFFF));
    put16(static_cast<uint16_t>(value >> 16));
}

void ZipWriter::put64(uint64_t value) {
    put32(static_cast<uint32_t>(value & 0xFFFFFFFF));
    put32(static_cast<uint32_t>(value >> 32));
}

} // namespace fileshare
