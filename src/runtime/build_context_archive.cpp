#include <dockhand/runtime/docker_stream.h>

#include <archive.h>
#include <archive_entry.h>
#include <sys/types.h>
#include <spdlog/spdlog.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace dockhand::runtime::docker {

namespace {

la_ssize_t appendToString(struct archive*, void* client, const void* buffer, size_t length) {
    auto* out = static_cast<std::string*>(client);
    out->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

struct ArchiveDeleter {
    void operator()(struct archive* a) const noexcept { archive_write_free(a); }
};

struct EntryDeleter {
    void operator()(struct archive_entry* e) const noexcept { archive_entry_free(e); }
};

Result<void> writeFileData(struct archive* a, const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot read " + path.string()};
    }
    std::array<char, 64 * 1024> buf{};
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in.gcount();
        if (got <= 0) {
            break;
        }
        if (archive_write_data(a, buf.data(), static_cast<size_t>(got)) < 0) {
            return Error{ErrorCode::IoError, std::string("archive write failed: ") +
                                                 archive_error_string(a)};
        }
    }
    return {};
}

} // namespace

Result<std::string> archiveDirectory(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::InvalidArgument, "not a directory: " + dir.string()};
    }

    std::string out;
    std::unique_ptr<struct archive, ArchiveDeleter> a(archive_write_new());
    archive_write_set_format_pax_restricted(a.get());
    archive_write_add_filter_none(a.get());
    if (archive_write_open(a.get(), &out, nullptr, appendToString, nullptr) != ARCHIVE_OK) {
        return Error{ErrorCode::IoError,
                     std::string("archive open failed: ") + archive_error_string(a.get())};
    }

    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& path = it->path();
        const auto rel = fs::relative(path, dir, ec);
        if (ec) {
            break;
        }
        const auto status = it->symlink_status(ec);
        if (ec) {
            break;
        }

        std::unique_ptr<struct archive_entry, EntryDeleter> entry(archive_entry_new());
        archive_entry_set_pathname(entry.get(), rel.generic_string().c_str());
        archive_entry_set_perm(entry.get(), static_cast<mode_t>(status.permissions()) & 07777);

        if (fs::is_symlink(status)) {
            const auto target = fs::read_symlink(path, ec);
            if (ec) {
                break;
            }
            archive_entry_set_filetype(entry.get(), AE_IFLNK);
            archive_entry_set_symlink(entry.get(), target.string().c_str());
        } else if (fs::is_directory(status)) {
            archive_entry_set_filetype(entry.get(), AE_IFDIR);
        } else if (fs::is_regular_file(status)) {
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(fs::file_size(path, ec)));
            if (ec) {
                break;
            }
        } else {
            spdlog::debug("[BuildContext] skipping special file {}", path.string());
            continue;
        }

        if (archive_write_header(a.get(), entry.get()) < ARCHIVE_WARN) {
            return Error{ErrorCode::IoError,
                         std::string("archive header failed: ") + archive_error_string(a.get())};
        }
        if (fs::is_regular_file(status)) {
            if (auto r = writeFileData(a.get(), path); !r) {
                return r.error();
            }
        }
    }
    if (ec) {
        return Error{ErrorCode::IoError, "walking " + dir.string() + ": " + ec.message()};
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        return Error{ErrorCode::IoError,
                     std::string("archive close failed: ") + archive_error_string(a.get())};
    }
    return out;
}

} // namespace dockhand::runtime::docker
