/*
 * PeerLink - directory archive tests
 */

#include "archive.hpp"
#include "test_support.hpp"
#include "utils.hpp"

#include <cstring>
#include <fstream>

#include <miniz.h>

using namespace peerlink;
using peerlink_test::throws_kind;

namespace {

void write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

std::string read_text(const std::filesystem::path& path) {
    auto bytes = read_file_bytes(path);
    return bytes ? std::string(bytes->begin(), bytes->end()) : std::string();
}

// Archive with one entry under a name the writer side would never produce.
void write_archive_with_entry(const std::filesystem::path& archive, const std::string& name, const std::string& body) {
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    CHECK(mz_zip_writer_init_file(&zip, archive.string().c_str(), 0));
    CHECK(mz_zip_writer_add_mem(&zip, name.c_str(), body.data(), body.size(), MZ_DEFAULT_COMPRESSION));
    CHECK(mz_zip_writer_finalize_archive(&zip));
    CHECK(mz_zip_writer_end(&zip));
}

void test_entry_names() {
    CHECK(is_safe_entry_name("a.txt"));
    CHECK(is_safe_entry_name("sub/dir/"));
    CHECK(is_safe_entry_name("sub/.hidden"));
    CHECK(!is_safe_entry_name(""));
    CHECK(!is_safe_entry_name("/etc/passwd"));
    CHECK(!is_safe_entry_name("../escape"));
    CHECK(!is_safe_entry_name("sub/../../escape"));
    CHECK(!is_safe_entry_name("sub//x"));
    CHECK(!is_safe_entry_name("./x"));
    CHECK(!is_safe_entry_name("a\\b"));
    CHECK(!is_safe_entry_name(std::string("a\nb")));
}

void test_pack_and_unpack() {
    auto root = peerlink_test::temp_dir("peerlink_archive_roundtrip");
    std::filesystem::create_directories(root / "docs" / "nested" / "deeper");
    std::filesystem::create_directories(root / "docs" / "blank");
    write_file(root / "docs" / "readme.txt", "top level");
    write_file(root / "docs" / "nested" / "deeper" / "notes.txt", std::string(20000, 'n'));

    auto packed = zip_directory(root / "docs", root / "docs.zip");
    CHECK(packed.entries == 5);
    CHECK(packed.uncompressed_bytes == 9 + 20000);

    auto unpacked = unzip_archive(root / "docs.zip", root / "copy", 1 << 20);
    CHECK(unpacked.entries == packed.entries);
    CHECK(read_text(root / "copy" / "readme.txt") == "top level");
    CHECK(read_text(root / "copy" / "nested" / "deeper" / "notes.txt") == std::string(20000, 'n'));
    CHECK(std::filesystem::is_directory(root / "copy" / "blank"));

    // The destination must be new.
    CHECK(throws_kind([&] { unzip_archive(root / "docs.zip", root / "copy", 1 << 20); }, ErrorKind::IoFailure));
    // Contents beyond the limit are refused before anything is written.
    CHECK(throws_kind([&] { unzip_archive(root / "docs.zip", root / "small", 1000); }, ErrorKind::SizeExceeded));
    CHECK(!std::filesystem::exists(root / "small"));

    CHECK(throws_kind([&] { zip_directory(root / "absent", root / "absent.zip"); }, ErrorKind::IoFailure));
}

void test_hostile_archives() {
    auto root = peerlink_test::temp_dir("peerlink_archive_hostile");
    write_archive_with_entry(root / "escape.zip", "../outside.txt", "gotcha");
    CHECK(throws_kind([&] { unzip_archive(root / "escape.zip", root / "dest", 1 << 20); }, ErrorKind::InvalidFormat));
    CHECK(!std::filesystem::exists(root / "dest"));
    CHECK(!std::filesystem::exists(root / "outside.txt"));

    write_file(root / "garbage.zip", "definitely not a zip");
    CHECK(throws_kind([&] { unzip_archive(root / "garbage.zip", root / "dest", 1 << 20); }, ErrorKind::InvalidFormat));
    CHECK(!std::filesystem::exists(root / "dest"));
}

} // namespace

int main() {
    try {
        test_entry_names();
        test_pack_and_unpack();
        test_hostile_archives();
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 2;
    }
    return peerlink_test::finish("archive_test");
}
