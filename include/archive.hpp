/*
 * PeerLink - directory archives
 *
 * A directory travels as one zip file. Entry names are relative to the
 * directory, use '/' separators, and directories end with '/'.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace peerlink {

struct ArchiveSummary {
    uint32_t entries = 0;
    uint64_t uncompressed_bytes = 0;
};

// Throws PeerLinkError(IoFailure) when the directory cannot be read or the
// archive cannot be written.
ArchiveSummary zip_directory(const std::filesystem::path& directory, const std::filesystem::path& archive);

// True for a relative entry name without "..", "." or empty components,
// backslashes or control characters.
bool is_safe_entry_name(const std::string& name);

// Extracts into destination, which must not exist yet. Throws
// PeerLinkError(InvalidFormat) for a corrupt archive or an unsafe entry name,
// PeerLinkError(SizeExceeded) when the contents exceed max_bytes and
// PeerLinkError(IoFailure) when writing fails. Nothing is left behind on error.
ArchiveSummary unzip_archive(const std::filesystem::path& archive,
                             const std::filesystem::path& destination,
                             uint64_t max_bytes);

} // namespace peerlink
