#include "zip_writer.hpp"
#include <zlib.h>
#include <array>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kLocalFileHeaderSignature = 0x04034b50U;
constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;
constexpr std::uint16_t kVersionNeeded = 20;              // 2.0, deflate
constexpr std::uint16_t kVersionMadeBy = (3 << 8) | 20;   // Unix host
constexpr std::uint16_t kMethodDeflate = 8;
constexpr std::uint16_t kFlagUtf8Names = 1 << 11;
constexpr std::uint64_t kMaxEntrySize = 0xFFFFFFFFULL;
constexpr std::size_t kChunkSize = 64 * 1024;

struct WrittenEntry {
    std::string name;
    std::uint16_t dos_time = 0;
    std::uint16_t dos_date = 0;
    std::uint32_t crc = 0;
    std::uint32_t compressed_size = 0;
    std::uint32_t size = 0;
    std::uint32_t external_attrs = 0;
    std::uint32_t local_header_offset = 0;
};

void write_u16(std::ofstream& out, std::uint16_t value) {
    const std::array<char, 2> bytes = {
        static_cast<char>(value & 0xFFU),
        static_cast<char>((value >> 8) & 0xFFU),
    };
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

void write_u32(std::ofstream& out, std::uint32_t value) {
    const std::array<char, 4> bytes = {
        static_cast<char>(value & 0xFFU),
        static_cast<char>((value >> 8) & 0xFFU),
        static_cast<char>((value >> 16) & 0xFFU),
        static_cast<char>((value >> 24) & 0xFFU),
    };
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

std::time_t file_mtime(const fs::path& p) {
    std::error_code ec;
    auto ftime = fs::last_write_time(p, ec);
    if (ec)
        return std::time(nullptr);
    auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::system_clock::to_time_t(sys);
}

/** Owns a raw-deflate zlib stream. */
struct DeflateStream {
    z_stream zs{};
    bool initialized = false;

    DeflateStream() {
        initialized = deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                                   Z_DEFAULT_STRATEGY) == Z_OK;
    }
    ~DeflateStream() {
        if (initialized)
            deflateEnd(&zs);
    }
    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;
};

void write_local_header(std::ofstream& out, const WrittenEntry& e) {
    write_u32(out, kLocalFileHeaderSignature);
    write_u16(out, kVersionNeeded);
    write_u16(out, kFlagUtf8Names);
    write_u16(out, kMethodDeflate);
    write_u16(out, e.dos_time);
    write_u16(out, e.dos_date);
    write_u32(out, e.crc);
    write_u32(out, e.compressed_size);
    write_u32(out, e.size);
    write_u16(out, static_cast<std::uint16_t>(e.name.size()));
    write_u16(out, 0); // extra field length
    out.write(e.name.data(), static_cast<std::streamsize>(e.name.size()));
}

bool write_entry_data(std::ofstream& out, const fs::path& source, WrittenEntry& e,
                      std::string& error) {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        error = "cannot open " + source.string();
        return false;
    }
    DeflateStream stream;
    if (!stream.initialized) {
        error = "deflateInit2 failed";
        return false;
    }
    std::vector<char> in_buf(kChunkSize);
    std::vector<char> out_buf(kChunkSize);
    uLong crc = crc32(0L, Z_NULL, 0);
    std::uint64_t total_in = 0;
    std::uint64_t total_out = 0;
    int flush = Z_NO_FLUSH;
    do {
        in.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
        std::streamsize n = in.gcount();
        if (in.bad()) {
            error = "read error on " + source.string();
            return false;
        }
        flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;
        total_in += static_cast<std::uint64_t>(n);
        if (total_in > kMaxEntrySize) {
            error = source.string() + " is larger than 4 GiB";
            return false;
        }
        crc = crc32(crc, reinterpret_cast<const Bytef*>(in_buf.data()), static_cast<uInt>(n));
        stream.zs.next_in = reinterpret_cast<Bytef*>(in_buf.data());
        stream.zs.avail_in = static_cast<uInt>(n);
        do {
            stream.zs.next_out = reinterpret_cast<Bytef*>(out_buf.data());
            stream.zs.avail_out = static_cast<uInt>(out_buf.size());
            int rc = deflate(&stream.zs, flush);
            if (rc == Z_STREAM_ERROR) {
                error = "deflate failed";
                return false;
            }
            std::size_t have = out_buf.size() - stream.zs.avail_out;
            out.write(out_buf.data(), static_cast<std::streamsize>(have));
            total_out += have;
        } while (stream.zs.avail_out == 0);
    } while (flush != Z_FINISH);
    if (total_out > kMaxEntrySize) {
        error = "compressed data for " + source.string() + " exceeds 4 GiB";
        return false;
    }
    e.crc = static_cast<std::uint32_t>(crc);
    e.size = static_cast<std::uint32_t>(total_in);
    e.compressed_size = static_cast<std::uint32_t>(total_out);
    return true;
}

bool write_archive(std::ofstream& out, const std::vector<ZipEntry>& entries, std::string& error) {
    std::vector<WrittenEntry> written;
    written.reserve(entries.size());
    for (const auto& entry : entries) {
        std::error_code ec;
        if (!fs::is_regular_file(entry.source, ec)) {
            error = entry.source.string() + " is not a regular file";
            return false;
        }
        if (entry.name.empty() || entry.name.size() > std::numeric_limits<std::uint16_t>::max()) {
            error = "invalid entry name for " + entry.source.string();
            return false;
        }
        WrittenEntry e;
        e.name = entry.name;
        to_dos_datetime(file_mtime(entry.source), e.dos_date, e.dos_time);
        auto perms = fs::status(entry.source, ec).permissions();
        std::uint32_t mode = 0100000U | (static_cast<std::uint32_t>(perms) & 0777U);
        e.external_attrs = mode << 16;

        std::streamoff offset = out.tellp();
        if (offset < 0 || static_cast<std::uint64_t>(offset) > kMaxEntrySize) {
            error = "archive exceeds 4 GiB";
            return false;
        }
        e.local_header_offset = static_cast<std::uint32_t>(offset);
        write_local_header(out, e); // sizes patched below
        if (!write_entry_data(out, entry.source, e, error))
            return false;
        std::streamoff end = out.tellp();
        out.seekp(offset);
        write_local_header(out, e);
        out.seekp(end);
        written.push_back(e);
    }

    std::streamoff cd_start = out.tellp();
    for (const auto& e : written) {
        write_u32(out, kCentralDirectoryHeaderSignature);
        write_u16(out, kVersionMadeBy);
        write_u16(out, kVersionNeeded);
        write_u16(out, kFlagUtf8Names);
        write_u16(out, kMethodDeflate);
        write_u16(out, e.dos_time);
        write_u16(out, e.dos_date);
        write_u32(out, e.crc);
        write_u32(out, e.compressed_size);
        write_u32(out, e.size);
        write_u16(out, static_cast<std::uint16_t>(e.name.size()));
        write_u16(out, 0); // extra field length
        write_u16(out, 0); // comment length
        write_u16(out, 0); // disk number start
        write_u16(out, 0); // internal attributes
        write_u32(out, e.external_attrs);
        write_u32(out, e.local_header_offset);
        out.write(e.name.data(), static_cast<std::streamsize>(e.name.size()));
    }
    std::streamoff cd_end = out.tellp();
    if (cd_end < 0 || static_cast<std::uint64_t>(cd_end) > kMaxEntrySize ||
        written.size() > 0xFFFFU) {
        error = "archive exceeds zip limits";
        return false;
    }

    write_u32(out, kEndOfCentralDirectorySignature);
    write_u16(out, 0); // disk number
    write_u16(out, 0); // disk with central directory
    write_u16(out, static_cast<std::uint16_t>(written.size()));
    write_u16(out, static_cast<std::uint16_t>(written.size()));
    write_u32(out, static_cast<std::uint32_t>(cd_end - cd_start));
    write_u32(out, static_cast<std::uint32_t>(cd_start));
    write_u16(out, 0); // comment length
    out.flush();
    if (!out) {
        error = "write error";
        return false;
    }
    return true;
}

} // namespace

bool write_zip_archive(const fs::path& archive, const std::vector<ZipEntry>& entries,
                       std::string& error) {
    bool ok = false;
    {
        std::ofstream out(archive, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "cannot create " + archive.string();
            return false;
        }
        ok = write_archive(out, entries, error);
        out.close();
        if (ok && out.fail()) {
            error = "failed to close " + archive.string();
            ok = false;
        }
    }
    if (!ok) {
        std::error_code ec;
        fs::remove(archive, ec);
    }
    return ok;
}
