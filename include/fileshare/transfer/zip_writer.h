#ifndef FILESHARE_TRANSFER_ZIP_WRITER_H
#define FILESHARE_TRANSFER_ZIP_WRITER_H

#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fileshare {

enum class ZipMethod {
    Store,
    Deflate
};

std::optional<ZipMethod> parse_zip_method(const std::string& name);

// Streaming ZIP encoder.
//
// Entries are written front to back with data descriptors, so no seeking is
// needed and the encoded bytes can go straight to a socket. Encoded output
// accumulates in pending() until the caller drains it with take_pending().
// ZIP64 records are emitted when sizes, offsets or the entry count exceed
// the classic 32/16-bit limits.
//
// zlib failures and misuse throw FileShareError(ErrorCode::ArchiveFailed).
class ZipWriter {
public:
    explicit ZipWriter(ZipMethod method = ZipMethod::Store, int deflate_level = 6);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // name uses '/' separators; a trailing '/' is added when missing
    void add_directory(const std::string& name, std::time_t modified);

    // size_hint selects ZIP64 local records for very large files
    void begin_file(const std::string& name, std::time_t modified, uint64_t size_hint = 0);
    void write_data(const void* data, size_t size);
    void end_file();

    // Central directory and end records; no entries may follow
    void finish();

    const std::vector<uint8_t>& pending() const { return pending_; }
    std::vector<uint8_t> take_pending();

    size_t entry_count() const { return entries_.size(); }
    uint64_t bytes_written() const { return offset_; }
    bool in_file() const { return in_file_; }
    bool finished() const { return finished_; }

private:
    struct Entry {
        std::string name;
        uint16_t method = 0;
        uint16_t flags = 0;
        uint16_t dos_time = 0;
        uint16_t dos_date = 0;
        uint32_t crc = 0;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint64_t local_offset = 0;
        uint32_t external_attributes = 0;
        bool zip64_local = false;
    };

    struct Deflater;

    void write_local_header(const Entry& entry);
    void write_central_header(const Entry& entry);
    void append(const void* data, size_t size);
    void put16(uint16_t value);
    void put32(uint32_t value);
    void put64(uint64_t value);

    ZipMethod method_;
    int deflate_level_;
    std::vector<Entry> entries_;
    std::vector<uint8_t> pending_;
    uint64_t offset_ = 0;
    bool in_file_ = false;
    bool finished_ = false;
    std::unique_ptr<Deflater> deflater_;
};

} // namespace fileshare

#endif // FILESHARE_TRANSFER_ZIP_WRITER_H
