/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "JarLoader.h"

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/mapped_file.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sys/types.h>
#include <utility>
#include <vector>
#include <zlib.h>

#include "Debug.h"
#include "Macros.h"
#include "Trace.h"

std::vector<uint8_t> ClassSource::load(const std::string& internal_name) const {
  auto bytes = find(internal_name);
  if (!bytes) {
    throw_typed(AgentGuardError::UNREADABLE_CLASS,
                "No class file for " + internal_name);
  }
  return std::move(*bytes);
}

DirectoryClassSource::DirectoryClassSource(std::string root)
    : m_root(std::move(root)) {}

boost::optional<std::vector<uint8_t>> DirectoryClassSource::find(
    const std::string& internal_name) const {
  boost::filesystem::path path(m_root);
  path /= internal_name + ".class";
  boost::system::error_code ec;
  if (!boost::filesystem::is_regular_file(path, ec)) {
    return boost::none;
  }
  std::ifstream ifs(path.string(), std::ifstream::binary);
  if (!ifs) {
    TRACE(JAR, 2, "Cannot open %s", path.string().c_str());
    return boost::none;
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(ifs)),
                             std::istreambuf_iterator<char>());
  return bytes;
}

std::vector<std::string> DirectoryClassSource::class_names() const {
  namespace fs = boost::filesystem;
  std::vector<std::string> names;
  fs::path root(m_root);
  for (fs::recursive_directory_iterator it(root), end; it != end; ++it) {
    const auto& path = it->path();
    if (!fs::is_regular_file(path) || path.extension() != ".class") {
      continue;
    }
    auto relative = path.lexically_relative(root);
    relative.replace_extension();
    names.push_back(relative.generic_string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

boost::optional<std::vector<uint8_t>> InMemoryClassSource::find(
    const std::string& internal_name) const {
  auto it = m_classes.find(internal_name);
  if (it == m_classes.end()) {
    return boost::none;
  }
  return it->second;
}

/******************
 * Begin Jar Loading code.
 *
 */

namespace jar_format {

/* CDFile
 * Central directory file header entry structures.
 */
constexpr uint16_t kCompMethodStore = 0;
constexpr uint16_t kCompMethodDeflate = 8;
constexpr std::array<uint8_t, 4> kCDFile = {'P', 'K', 0x01, 0x02};

PACKED(struct pk_cd_file {
  uint32_t signature;
  uint16_t vmade;
  uint16_t vextract;
  uint16_t flags;
  uint16_t comp_method;
  uint16_t mod_time;
  uint16_t mod_date;
  uint32_t crc32;
  uint32_t comp_size;
  uint32_t ucomp_size;
  uint16_t fname_len;
  uint16_t extra_len;
  uint16_t comment_len;
  uint16_t diskno;
  uint16_t interal_attr;
  uint32_t external_attr;
  uint32_t disk_offset;
});

/* CDirEnd:
 * End of central directory record structures.
 */
constexpr int kMaxCDirEndSearch = 100;
constexpr std::array<uint8_t, 4> kCDirEnd = {'P', 'K', 0x05, 0x06};

PACKED(struct pk_cdir_end {
  uint32_t signature;
  uint16_t diskno;
  uint16_t cd_diskno;
  uint16_t cd_disk_entries;
  uint16_t cd_entries;
  uint32_t cd_size;
  uint32_t cd_disk_offset;
  uint16_t comment_len;
});

/* LFile:
 * Local file header structures.
 */
constexpr std::array<uint8_t, 4> kLFile = {'P', 'K', 0x03, 0x04};

PACKED(struct pk_lfile {
  uint32_t signature;
  uint16_t vextract;
  uint16_t flags;
  uint16_t comp_method;
  uint16_t mod_time;
  uint16_t mod_date;
  uint32_t crc32;
  uint32_t comp_size;
  uint32_t ucomp_size;
  uint16_t fname_len;
  uint16_t extra_len;
});

constexpr size_t kMaxClassSize = static_cast<size_t>(8 * 1024 * 1024);
constexpr std::string_view kClassEndString = ".class";

struct jar_entry {
  struct pk_cd_file cd_entry;
  std::string filename;
};

pk_cdir_end find_central_directory(const uint8_t* mapping, ssize_t size) {
  ssize_t soffset = size - static_cast<ssize_t>(sizeof(pk_cdir_end));
  always_assert_type_log(soffset >= 0, AgentGuardError::INVALID_JAVA,
                         "Zip too small");
  ssize_t eoffset = std::max((ssize_t)0, soffset - kMaxCDirEndSearch);
  do {
    const uint8_t* cdsearch = mapping + soffset;
    if (memcmp(cdsearch, kCDirEnd.data(), kCDirEnd.size()) == 0) {
      pk_cdir_end pce;
      memcpy(&pce, cdsearch, sizeof(pk_cdir_end));
      return pce;
    }
  } while (soffset-- > eoffset);
  throw_typed(AgentGuardError::INVALID_JAVA,
              "End of central directory record not found");
}

void validate_pce(const pk_cdir_end& pce, ssize_t size) {
  // Disk spanning is not supported.
  always_assert_type_log(pce.cd_diskno == pce.diskno && pce.cd_diskno == 0 &&
                             pce.cd_entries == pce.cd_disk_entries,
                         AgentGuardError::INVALID_JAVA,
                         "Disk spanning is not supported");
  ssize_t data_size = size - static_cast<ssize_t>(sizeof(pk_cdir_end));
  always_assert_type_log(
      (ssize_t)pce.cd_disk_offset + (ssize_t)pce.cd_size <= data_size,
      AgentGuardError::INVALID_JAVA,
      "Central directory overflow, invalid pce structure");
}

jar_entry extract_jar_entry(const uint8_t*& mapping,
                            size_t& offset,
                            size_t total_size) {
  jar_entry je;
  always_assert_type_log(offset + sizeof(pk_cd_file) <= total_size,
                         AgentGuardError::INVALID_JAVA,
                         "Reading mapping out of bound");
  always_assert_type_log(memcmp(mapping, kCDFile.data(), kCDFile.size()) == 0,
                         AgentGuardError::INVALID_JAVA,
                         "Invalid central directory entry");
  memcpy(&je.cd_entry, mapping, sizeof(pk_cd_file));
  offset += sizeof(pk_cd_file);
  mapping += sizeof(pk_cd_file);
  always_assert_type_log(offset + je.cd_entry.fname_len <= total_size,
                         AgentGuardError::INVALID_JAVA,
                         "Reading mapping out of bound");
  je.filename = std::string((const char*)mapping, je.cd_entry.fname_len);
  size_t skipped = (size_t)je.cd_entry.fname_len + je.cd_entry.extra_len +
                   je.cd_entry.comment_len;
  offset += skipped;
  mapping += skipped;
  return je;
}

std::vector<jar_entry> get_jar_entries(const uint8_t* mapping,
                                       size_t size,
                                       const pk_cdir_end& pce) {
  const uint8_t* cdir = mapping + pce.cd_disk_offset;
  std::vector<jar_entry> files;
  files.reserve(pce.cd_entries);
  size_t offset = pce.cd_disk_offset;
  for (int entry = 0; entry < pce.cd_entries; entry++) {
    files.emplace_back(extract_jar_entry(cdir, offset, size));
  }
  return files;
}

void jar_uncompress(Bytef* dest,
                    uLongf* destLen,
                    const Bytef* source,
                    uLong sourceLen,
                    uint32_t comp_method) {
  if (comp_method == kCompMethodStore) {
    always_assert_type_log(sourceLen <= *destLen, AgentGuardError::INVALID_JAVA,
                           "Not enough space for STOREd entry: %lu vs %lu",
                           sourceLen, *destLen);
    memcpy(dest, source, sourceLen);
    *destLen = sourceLen;
    return;
  }

  z_stream stream;
  int err;

  stream.next_in = (Bytef*)source;
  stream.avail_in = (uInt)sourceLen;
  stream.next_out = dest;
  stream.avail_out = (uInt)*destLen;
  stream.zalloc = (alloc_func)0;
  stream.zfree = (free_func)0;
  stream.opaque = (voidpf)0;

  err = inflateInit2(&stream, -MAX_WBITS);
  always_assert_type_log(err == Z_OK, AgentGuardError::INVALID_JAVA,
                         "Failed decompression");

  err = inflate(&stream, Z_FINISH);
  if (err != Z_STREAM_END) {
    inflateEnd(&stream);
    throw_typed(AgentGuardError::INVALID_JAVA, "Failed decompression");
  }
  *destLen = stream.total_out;

  err = inflateEnd(&stream);
  always_assert_type_log(err == Z_OK, AgentGuardError::INVALID_JAVA,
                         "Failed inflateEnd");
}

std::vector<uint8_t> decompress_class(const jar_entry& file,
                                      const uint8_t* mapping,
                                      size_t map_size) {
  always_assert_type_log(file.cd_entry.comp_method == kCompMethodDeflate ||
                             file.cd_entry.comp_method == kCompMethodStore,
                         AgentGuardError::INVALID_JAVA,
                         "Unknown compression method %u for %s",
                         file.cd_entry.comp_method, file.filename.c_str());
  // Reject uncharacteristically large files.
  always_assert_type_log(file.cd_entry.ucomp_size <= kMaxClassSize,
                         AgentGuardError::INVALID_JAVA,
                         "Entry %s with size %u is too large",
                         file.filename.c_str(), file.cd_entry.ucomp_size);

  always_assert_type_log(file.cd_entry.disk_offset + sizeof(pk_lfile) <
                             map_size,
                         AgentGuardError::INVALID_JAVA,
                         "Entry out of map bounds!");
  const uint8_t* lfile = mapping + file.cd_entry.disk_offset;
  always_assert_type_log(memcmp(lfile, kLFile.data(), kLFile.size()) == 0,
                         AgentGuardError::INVALID_JAVA,
                         "Invalid local file entry");

  pk_lfile pkf;
  memcpy(&pkf, lfile, sizeof(pk_lfile));
  // Streamed entries record their sizes only in the central directory.
  if (pkf.comp_size == 0 && pkf.ucomp_size == 0) {
    pkf.comp_size = file.cd_entry.comp_size;
    pkf.ucomp_size = file.cd_entry.ucomp_size;
  }
  lfile += sizeof(pk_lfile);

  always_assert_type_log(file.cd_entry.disk_offset + sizeof(pk_lfile) +
                                 pkf.fname_len + pkf.extra_len +
                                 pkf.comp_size <=
                             map_size,
                         AgentGuardError::INVALID_JAVA,
                         "Complete entry exceeds mapping bounds.");
  always_assert_type_log(
      pkf.fname_len == file.cd_entry.fname_len &&
          pkf.comp_size == file.cd_entry.comp_size &&
          pkf.ucomp_size == file.cd_entry.ucomp_size &&
          pkf.comp_method == file.cd_entry.comp_method &&
          file.filename == std::string_view((const char*)lfile, pkf.fname_len),
      AgentGuardError::INVALID_JAVA,
      "Directory entry doesn't match local file header for %s",
      file.filename.c_str());

  lfile += pkf.fname_len;
  lfile += pkf.extra_len;

  std::vector<uint8_t> out(pkf.ucomp_size);
  uLongf dlen = out.size();
  jar_uncompress(out.data(), &dlen, lfile, pkf.comp_size,
                 file.cd_entry.comp_method);
  always_assert_type_log(dlen == pkf.ucomp_size, AgentGuardError::INVALID_JAVA,
                         "mis-match on uncompressed size");
  return out;
}

bool is_class_entry(const jar_entry& file) {
  std::string_view filename = file.filename;
  return file.cd_entry.ucomp_size != 0 &&
         filename.length() > kClassEndString.length() &&
         filename.substr(filename.length() - kClassEndString.length()) ==
             kClassEndString;
}

std::vector<jar_entry> read_directory(const uint8_t* mapping, size_t size) {
  auto pce = find_central_directory(mapping, static_cast<ssize_t>(size));
  validate_pce(pce, static_cast<ssize_t>(size));
  return get_jar_entries(mapping, size, pce);
}

std::unique_ptr<boost::iostreams::mapped_file> map_file(
    const std::string& path) {
  auto file = std::make_unique<boost::iostreams::mapped_file>();
  try {
    file->open(path.c_str(), boost::iostreams::mapped_file::readonly);
  } catch (const std::exception& e) {
    throw_typed(AgentGuardError::UNREADABLE_CLASS,
                "Cannot map " + path + ": " + e.what());
  }
  return file;
}

} // namespace jar_format

using namespace jar_format;

struct JarClassSource::Entry : public jar_entry {};

JarClassSource::JarClassSource(const std::string& path)
    : m_path(path), m_file(map_file(path)) {
  const auto* mapping = reinterpret_cast<const uint8_t*>(m_file->const_data());
  for (auto& file : read_directory(mapping, m_file->size())) {
    if (!is_class_entry(file)) {
      continue;
    }
    auto name = file.filename.substr(
        0, file.filename.size() - kClassEndString.size());
    Entry entry;
    static_cast<jar_entry&>(entry) = std::move(file);
    if (m_by_name.emplace(name, m_entries.size()).second) {
      m_entries.push_back(std::move(entry));
    } else {
      TRACE(JAR, 1, "Warning: duplicate entry %s in %s", name.c_str(),
            path.c_str());
    }
  }
  TRACE(JAR, 2, "Indexed %zu classes in %s", m_entries.size(), path.c_str());
}

JarClassSource::~JarClassSource() {}

boost::optional<std::vector<uint8_t>> JarClassSource::find(
    const std::string& internal_name) const {
  auto it = m_by_name.find(internal_name);
  if (it == m_by_name.end()) {
    return boost::none;
  }
  const auto* mapping = reinterpret_cast<const uint8_t*>(m_file->const_data());
  return decompress_class(m_entries[it->second], mapping, m_file->size());
}

std::vector<std::string> JarClassSource::class_names() const {
  std::vector<std::string> names;
  names.reserve(m_entries.size());
  for (const auto& entry : m_entries) {
    names.push_back(entry.filename.substr(
        0, entry.filename.size() - kClassEndString.size()));
  }
  return names;
}

std::unique_ptr<ClassPath> ClassPath::parse(const std::string& path_list) {
  auto classpath = std::make_unique<ClassPath>();
  std::vector<std::string> elements;
  boost::split(elements, path_list, boost::is_any_of(":"));
  for (const auto& element : elements) {
    if (element.empty()) {
      continue;
    }
    boost::system::error_code ec;
    if (boost::filesystem::is_directory(element, ec)) {
      classpath->add(std::make_unique<DirectoryClassSource>(element));
    } else if (boost::algorithm::ends_with(element, ".jar") ||
               boost::algorithm::ends_with(element, ".zip")) {
      classpath->add(std::make_unique<JarClassSource>(element));
    } else {
      throw_typed(AgentGuardError::INVALID_CONFIG,
                  "Class path element is neither a directory nor a jar: " +
                      element);
    }
  }
  return classpath;
}

boost::optional<std::vector<uint8_t>> ClassPath::find(
    const std::string& internal_name) const {
  for (const auto& source : m_sources) {
    auto bytes = source->find(internal_name);
    if (bytes) {
      return bytes;
    }
  }
  return boost::none;
}
