#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

class File {
 public:
  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Writes the given contents to path, atomically replacing it if overwrite
  // is set. Missing parent folders are created.
  static void Write(const std::string& path, const std::string& contents,
                    bool overwrite = false);

  // Creates path and every missing ancestor as directories.
  static void MakeDirs(const std::string& path);

  // Makes a full copy of the given file, creating the parent folders of the
  // destination.
  static void Copy(const std::string& from, const std::string& to,
                   bool overwrite = false);

  // Unlinks a single file or empty directory.
  static void Remove(const std::string& path);

  // Deletes path with everything below it. Missing paths are ignored.
  static void RemoveTree(const std::string& path);

  // Lists the entries of a directory, excluding "." and "..".
  static std::vector<std::string> ListDir(const std::string& path);

  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Everything up to the last slash; "." when there is none.
  static std::string BaseDir(const std::string& path);

  static std::string BaseName(const std::string& path);

  // Size in bytes, or -1 when path cannot be stat'ed.
  static int64_t Size(const std::string& path);

  static bool Exists(const std::string& path);
  static bool IsDirectory(const std::string& path);
  static bool IsRegularFile(const std::string& path);
};

// A uniquely named directory under base, deleted on destruction unless
// Keep() was called.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
