/*
 * PeerLink - directory archives implementation
 */

#include "archive.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <cstring>
#include <system_error>
#include <vector>

#include <miniz.h>

namespace peerlink {

namespace {

std::string zip_error(mz_zip_archive& zip) {
    return mz_zip_get_error_string(mz_zip_get_last_error(&zip));
}

class ZipWriter {
public:
    explicit ZipWriter(const std::filesystem::path& archive) {
        std::memset(&zip_, 0, sizeof(zip_));
        if (!mz_zip_writer_init_file(&zip_, archive.string().c_str(), 0)) {
            throw PeerLinkError(ErrorKind::IoFailure, "Cannot create " + archive.string() + ": " + zip_error(zip_));
        }
        open_ = true;
    }

    ~ZipWriter() {
        if (open_) {
            mz_zip_writer_end(&zip_);
        }
    }

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    void add_directory(const std::string& name) {
        const std::string entry = name + "/";
        if (!mz_zip_writer_add_mem(&zip_, entry.c_str(), nullptr, 0, MZ_NO_COMPRESSION)) {
            throw PeerLinkError(ErrorKind::IoFailure, "Cannot add " + entry + ": " + zip_error(zip_));
        }
    }

    void add_file(const std::string& name, const std::filesystem::path& source) {
        if (!mz_zip_writer_add_file(&zip_, name.c_str(), source.string().c_str(), nullptr, 0,
                                    MZ_DEFAULT_COMPRESSION)) {
            throw PeerLinkError(ErrorKind::IoFailure, "Cannot add " + source.string() + ": " + zip_error(zip_));
        }
    }

    void finish() {
        const bool finalized = mz_zip_writer_finalize_archive(&zip_);
        const std::string error = finalized ? std::string() : zip_error(zip_);
        const bool ended = mz_zip_writer_end(&zip_);
        open_ = false;
        if (!finalized || !ended) {
            throw PeerLinkError(ErrorKind::IoFailure, "Cannot finish archive: " + error);
        }
    }

private:
    mz_zip_archive zip_;
    bool open_ = false;
};

class ZipReader {
public:
    explicit ZipReader(const std::filesystem::path& archive) {
        std::memset(&zip_, 0, sizeof(zip_));
        if (!mz_zip_reader_init_file(&zip_, archive.string().c_str(), 0)) {
            throw PeerLinkError(ErrorKind::InvalidFormat, "Not a zip archive: " + zip_error(zip_));
        }
    }

    ~ZipReader() { mz_zip_reader_end(&zip_); }

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    mz_zip_archive* get() { return &zip_; }

private:
    mz_zip_archive zip_;
};

} // namespace

ArchiveSummary zip_directory(const std::filesystem::path& directory, const std::filesystem::path& archive) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw PeerLinkError(ErrorKind::IoFailure, directory.string() + " is not a directory");
    }

    ArchiveSummary summary;
    ZipWriter writer(archive);
    std::filesystem::recursive_directory_iterator it(directory, ec);
    if (ec) {
        throw PeerLinkError(ErrorKind::IoFailure, "Cannot read " + directory.string() + ": " + ec.message());
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw PeerLinkError(ErrorKind::IoFailure, "Cannot read " + directory.string() + ": " + ec.message());
        }
        const std::string name = it->path().lexically_relative(directory).generic_string();
        if (it->is_directory(ec)) {
            writer.add_directory(name);
        } else if (it->is_regular_file(ec)) {
            writer.add_file(name, it->path());
            summary.uncompressed_bytes += it->file_size(ec);
        } else {
            log_warn("Skipping " + it->path().string() + ": not a regular file");
            continue;
        }
        ++summary.entries;
    }
    if (ec) {
        throw PeerLinkError(ErrorKind::IoFailure, "Cannot read " + directory.string() + ": " + ec.message());
    }
    writer.finish();
    log_info("Packed " + directory.filename().string() + " (" + std::to_string(summary.entries) + " entries)");
    return summary;
}

bool is_safe_entry_name(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.find('\\') != std::string::npos) {
        return false;
    }
    for (unsigned char c : name) {
        if (c < 0x20 || c == 0x7F) {
            return false;
        }
    }
    std::string trimmed = name;
    if (trimmed.back() == '/') {
        trimmed.pop_back();
    }
    std::size_t start = 0;
    while (start <= trimmed.size()) {
        std::size_t end = trimmed.find('/', start);
        if (end == std::string::npos) {
            end = trimmed.size();
        }
        const std::string part = trimmed.substr(start, end - start);
        if (part.empty() || part == "." || part == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

ArchiveSummary unzip_archive(const std::filesystem::path& archive,
                             const std::filesystem::path& destination,
                             uint64_t max_bytes) {
    std::error_code ec;
    if (std::filesystem::exists(destination, ec)) {
        throw PeerLinkError(ErrorKind::IoFailure, destination.string() + " already exists");
    }

    ZipReader reader(archive);
    mz_zip_archive* zip = reader.get();
    const mz_uint count = mz_zip_reader_get_num_files(zip);

    // Check every entry before anything touches the disk.
    ArchiveSummary summary;
    std::vector<mz_zip_archive_file_stat> entries(count);
    for (mz_uint i = 0; i < count; ++i) {
        if (!mz_zip_reader_file_stat(zip, i, &entries[i])) {
            throw PeerLinkError(ErrorKind::InvalidFormat, "Corrupt archive entry: " + zip_error(*zip));
        }
        const std::string name = entries[i].m_filename;
        if (!is_safe_entry_name(name)) {
            throw PeerLinkError(ErrorKind::InvalidFormat, "Unsafe archive entry '" + name + "'");
        }
        summary.uncompressed_bytes += entries[i].m_uncomp_size;
        if (summary.uncompressed_bytes > max_bytes) {
            throw PeerLinkError(ErrorKind::SizeExceeded, "Archive expands beyond " + std::to_string(max_bytes) +
                                                             " bytes");
        }
    }

    std::filesystem::create_directories(destination, ec);
    if (ec) {
        throw PeerLinkError(ErrorKind::IoFailure, "Cannot create " + destination.string() + ": " + ec.message());
    }
    try {
        for (mz_uint i = 0; i < count; ++i) {
            const std::filesystem::path target = destination / std::filesystem::path(entries[i].m_filename);
            if (mz_zip_reader_is_file_a_directory(zip, i)) {
                std::filesystem::create_directories(target, ec);
            } else {
                std::filesystem::create_directories(target.parent_path(), ec);
                if (!ec && !mz_zip_reader_extract_to_file(zip, i, target.string().c_str(), 0)) {
                    throw PeerLinkError(ErrorKind::IoFailure,
                                        "Cannot extract " + std::string(entries[i].m_filename) + ": " +
                                            zip_error(*zip));
                }
            }
            if (ec) {
                throw PeerLinkError(ErrorKind::IoFailure, "Cannot create " + target.string() + ": " + ec.message());
            }
            ++summary.entries;
        }
    } catch (const PeerLinkError&) {
        std::filesystem::remove_all(destination, ec);
        throw;
    }
    return summary;
}

} // namespace peerlink
