#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <core/constants.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace platform {

namespace {

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

struct EntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

std::string archive_err(struct archive* a, const std::string& what) {
    const char* msg = archive_error_string(a);
    return what + ": " + (msg ? msg : "unknown libarchive error");
}

int64_t mtime_seconds(const fs::path& p) {
    auto ftime = fs::last_write_time(p);
    auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

} // namespace

std::size_t create_zip(const fs::path& zip_path, const fs::path& base_dir) {
    if (!fs::is_directory(base_dir)) {
        throw std::runtime_error("Not a directory: " + base_dir.string());
    }

    // Sorted so the same tree always yields the same entry order
    std::vector<fs::path> entries;
    for (const auto& e : fs::recursive_directory_iterator(base_dir)) {
        if (e.is_directory() || e.is_regular_file()) entries.push_back(e.path());
    }
    std::sort(entries.begin(), entries.end());

    std::error_code ec;
    fs::remove(zip_path, ec);

    std::unique_ptr<struct archive, ArchiveWriteDeleter> a(archive_write_new());
    if (!a) throw std::runtime_error("Failed to create archive writer");

    if (archive_write_set_format_zip(a.get()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_err(a.get(), "Failed to select zip format"));
    }
    if (archive_write_open_filename(a.get(), zip_path.string().c_str()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_err(a.get(), "Failed to open zip file"));
    }

    std::unique_ptr<struct archive_entry, EntryDeleter> entry(archive_entry_new());
    std::size_t files = 0;
    std::vector<char> buf(ARCHIVE_BUF_SIZE);

    for (const auto& full_path : entries) {
        std::string rel = fs::relative(full_path, base_dir).generic_string();
        bool is_dir = fs::is_directory(full_path);

        archive_entry_clear(entry.get());
        archive_entry_set_pathname(entry.get(), is_dir ? (rel + "/").c_str() : rel.c_str());
        archive_entry_set_mtime(entry.get(), mtime_seconds(full_path), 0);
        if (is_dir) {
            archive_entry_set_filetype(entry.get(), AE_IFDIR);
            archive_entry_set_perm(entry.get(), 0755);
            archive_entry_set_size(entry.get(), 0);
        } else {
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            archive_entry_set_size(entry.get(), static_cast<int64_t>(fs::file_size(full_path)));
        }

        if (archive_write_header(a.get(), entry.get()) != ARCHIVE_OK) {
            throw std::runtime_error(archive_err(a.get(), "Failed to write entry " + rel));
        }
        if (is_dir) continue;

        // Write file contents in chunks
        std::ifstream in(full_path, std::ios::binary);
        if (!in) throw std::runtime_error("Failed to read " + full_path.string());

        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            auto bytes_read = in.gcount();
            if (bytes_read > 0 &&
                archive_write_data(a.get(), buf.data(), static_cast<size_t>(bytes_read)) < 0) {
                throw std::runtime_error(archive_err(a.get(), "Failed to write data for " + rel));
            }
        }
        files++;
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_err(a.get(), "Failed to finalize zip"));
    }
    return files;
}

} // namespace platform
