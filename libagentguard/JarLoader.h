/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace boost {
namespace iostreams {
class mapped_file;
} // namespace iostreams
} // namespace boost

/*
 * Where class bytes come from when the host does not hand them over: the
 * resource lookup by internal name ("java/lang/Thread").
 */
class ClassSource {
 public:
  virtual ~ClassSource() = default;

  virtual boost::optional<std::vector<uint8_t>> find(
      const std::string& internal_name) const = 0;

  // Like find(), but a missing class raises UNREADABLE_CLASS.
  std::vector<uint8_t> load(const std::string& internal_name) const;
};

class DirectoryClassSource : public ClassSource {
 public:
  explicit DirectoryClassSource(std::string root);

  boost::optional<std::vector<uint8_t>> find(
      const std::string& internal_name) const override;

  // Internal names of every class file under the root, sorted.
  std::vector<std::string> class_names() const;

 private:
  std::string m_root;
};

/*
 * A memory mapped jar (zip) file. The central directory is indexed once;
 * entries are inflated on lookup.
 */
class JarClassSource : public ClassSource {
 public:
  explicit JarClassSource(const std::string& path);
  ~JarClassSource() override;

  boost::optional<std::vector<uint8_t>> find(
      const std::string& internal_name) const override;

  // Internal names of every class in the jar, in directory order.
  std::vector<std::string> class_names() const;

  const std::string& path() const { return m_path; }

 private:
  struct Entry;

  std::string m_path;
  std::unique_ptr<boost::iostreams::mapped_file> m_file;
  std::vector<Entry> m_entries;
  std::unordered_map<std::string, size_t> m_by_name;
};

class InMemoryClassSource : public ClassSource {
 public:
  void add(const std::string& internal_name, std::vector<uint8_t> bytes) {
    m_classes[internal_name] = std::move(bytes);
  }

  boost::optional<std::vector<uint8_t>> find(
      const std::string& internal_name) const override;

 private:
  std::unordered_map<std::string, std::vector<uint8_t>> m_classes;
};

/*
 * Searches its sources in order, like a class path.
 */
class ClassPath : public ClassSource {
 public:
  void add(std::unique_ptr<ClassSource> source) {
    m_sources.push_back(std::move(source));
  }

  /*
   * Builds a class path from a ':' separated list of jars and directories.
   */
  static std::unique_ptr<ClassPath> parse(const std::string& path_list);

  boost::optional<std::vector<uint8_t>> find(
      const std::string& internal_name) const override;

  size_t size() const { return m_sources.size(); }

 private:
  std::vector<std::unique_ptr<ClassSource>> m_sources;
};
