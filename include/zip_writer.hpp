#ifndef ZIP_WRITER_HPP
#define ZIP_WRITER_HPP

#include <filesystem>
#include <string>
#include <vector>

/** One file to store in an archive. */
struct ZipEntry {
    std::filesystem::path source; ///< File on disk
    std::string name;             ///< Name inside the archive, '/' separated
};

/**
 * @brief Write a PKZIP archive containing @p entries.
 *
 * Each entry is deflate-compressed with zlib and carries the source file's
 * modification time and permission bits. Sources must be regular files no
 * larger than 4 GiB (no ZIP64 support). An existing file at @p archive is
 * truncated. On failure the partially written archive is removed.
 *
 * @param archive Output path.
 * @param entries Files to add, in order.
 * @param error   Receives a description of the failure.
 * @return `true` on success.
 */
bool write_zip_archive(const std::filesystem::path& archive, const std::vector<ZipEntry>& entries,
                       std::string& error);

#endif // ZIP_WRITER_HPP
