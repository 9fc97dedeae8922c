#include "archive_normalize.h"

#include "errors.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>
#include <utility>

namespace rtpack {
namespace {

std::string error_text(archive *a) {
  char const *err{ archive_error_string(a) };
  return err ? err : "unknown error";
}

struct archive_reader : unmovable {
  explicit archive_reader(std::vector<unsigned char> const &bytes)
      : handle(archive_read_new()) {
    if (!handle) { throw std::runtime_error("archive_read_new failed"); }
    archive_read_support_filter_none(handle);
    archive_read_support_format_tar(handle);

    if (archive_read_open_memory(handle, bytes.data(), bytes.size()) != ARCHIVE_OK) {
      std::string const err{ error_text(handle) };
      archive_read_free(handle);
      throw integrity_error("Failed to open tar stream: " + err);
    }
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  archive *handle{ nullptr };
};

la_ssize_t append_to_vector(archive *, void *client, void const *buf, size_t len) {
  auto *out{ static_cast<std::vector<unsigned char> *>(client) };
  auto const *bytes{ static_cast<unsigned char const *>(buf) };
  out->insert(out->end(), bytes, bytes + len);
  return static_cast<la_ssize_t>(len);
}

struct archive_memory_writer : unmovable {
  explicit archive_memory_writer(std::vector<unsigned char> &out)
      : handle(archive_write_new()) {
    if (!handle) { throw std::runtime_error("archive_write_new failed"); }
    if (archive_write_set_format_pax_restricted(handle) != ARCHIVE_OK ||
        archive_write_add_filter_none(handle) != ARCHIVE_OK ||
        archive_write_open(handle, &out, nullptr, append_to_vector, nullptr) !=
            ARCHIVE_OK) {
      std::string const err{ error_text(handle) };
      archive_write_free(handle);
      throw std::runtime_error("Failed to open tar writer: " + err);
    }
  }

  ~archive_memory_writer() {
    if (handle) { archive_write_free(handle); }
  }

  void close() {
    if (archive_write_close(handle) != ARCHIVE_OK) {
      throw std::runtime_error("Failed to finish tar stream: " + error_text(handle));
    }
  }

  archive *handle{ nullptr };
};

using entry_ptr_t = std::unique_ptr<archive_entry, decltype(&archive_entry_free)>;

struct member {
  entry_ptr_t entry;
  std::string path;
  std::vector<unsigned char> data;
};

std::vector<member> read_members(std::vector<unsigned char> const &tar) {
  archive_reader reader{ tar };
  std::vector<member> members;

  while (true) {
    archive_entry *entry{ nullptr };
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { break; }
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw integrity_error("Failed to read tar header: " + error_text(reader.handle));
    }

    char const *path{ archive_entry_pathname(entry) };
    if (!path) { throw integrity_error("Tar member has no path"); }

    member m{ entry_ptr_t{ archive_entry_clone(entry), &archive_entry_free }, path, {} };
    if (!m.entry) { throw std::runtime_error("archive_entry_clone failed"); }

    std::array<unsigned char, 64 * 1024> buf;
    while (true) {
      la_ssize_t const n{ archive_read_data(reader.handle, buf.data(), buf.size()) };
      if (n == 0) { break; }
      if (n < 0) {
        throw integrity_error("Failed to read tar member " + m.path + ": " +
                              error_text(reader.handle));
      }
      m.data.insert(m.data.end(), buf.begin(), buf.begin() + n);
    }

    if (archive_entry_filetype(entry) == AE_IFDIR) { continue; }
    members.push_back(std::move(m));
  }

  return members;
}

void canonicalize(archive_entry *e, std::size_t data_size) {
  archive_entry_xattr_clear(e);
  archive_entry_acl_clear(e);
  archive_entry_sparse_clear(e);
  archive_entry_copy_mac_metadata(e, nullptr, 0);
  archive_entry_set_fflags(e, 0, 0);

  archive_entry_unset_atime(e);
  archive_entry_unset_ctime(e);
  archive_entry_unset_birthtime(e);
  archive_entry_set_mtime(e, kNormalizedMtime, 0);

  archive_entry_set_uid(e, 0);
  archive_entry_set_gid(e, 0);
  archive_entry_copy_uname(e, kNormalizedOwner);
  archive_entry_copy_gname(e, kNormalizedOwner);
  archive_entry_set_dev(e, 0);
  archive_entry_set_ino(e, 0);

  auto perm{ archive_entry_perm(e) | 0660 };
  if (perm & 0100) { perm |= 0010; }
  archive_entry_set_perm(e, perm);

  if (archive_entry_filetype(e) == AE_IFREG) {
    archive_entry_set_size(e, static_cast<la_int64_t>(data_size));
  }
}

}  // namespace

std::vector<unsigned char> normalize_tar(std::vector<unsigned char> const &tar,
                                         normalize_options const &options) {
  auto members{ read_members(tar) };

  std::ranges::stable_sort(members, [&](member const &a, member const &b) {
    bool const a_meta{ a.path == options.metadata_member };
    bool const b_meta{ b.path == options.metadata_member };
    if (a_meta != b_meta) { return a_meta; }
    return a.path < b.path;
  });

  std::vector<unsigned char> out;
  archive_memory_writer writer{ out };

  for (auto &m : members) {
    canonicalize(m.entry.get(), m.data.size());

    if (int const r{ archive_write_header(writer.handle, m.entry.get()) };
        r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw std::runtime_error("Failed to write tar header for " + m.path + ": " +
                               error_text(writer.handle));
    }

    if (!m.data.empty()) {
      la_ssize_t const written{
        archive_write_data(writer.handle, m.data.data(), m.data.size())
      };
      if (written < 0 || static_cast<std::size_t>(written) != m.data.size()) {
        throw std::runtime_error("Failed to write tar data for " + m.path + ": " +
                                 error_text(writer.handle));
      }
    }

    if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
      throw std::runtime_error("Failed to finish tar member " + m.path + ": " +
                               error_text(writer.handle));
    }
  }

  writer.close();
  return out;
}

std::vector<std::string> tar_member_paths(std::vector<unsigned char> const &tar) {
  archive_reader reader{ tar };
  std::vector<std::string> paths;

  archive_entry *entry{ nullptr };
  while (true) {
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { break; }
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw integrity_error("Failed to read tar header: " + error_text(reader.handle));
    }
    paths.emplace_back(archive_entry_pathname(entry));
    if (archive_read_data_skip(reader.handle) != ARCHIVE_OK) {
      throw integrity_error("Failed to skip tar member data: " +
                            error_text(reader.handle));
    }
  }

  return paths;
}

}  // namespace rtpack
