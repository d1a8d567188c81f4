#include "util/file.hpp"

#include <stdlib.h>
#include <string.h>

#include <fstream>
#include <memory>

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";
static const constexpr size_t kChunkSize = 32 * 1024;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

struct FreeDeleter {
  void operator()(char* p) const { free(p); }
};
using CString = std::unique_ptr<char, FreeDeleter>;

std::string OsTempDir(const std::string& path) {
  CString data{strdup(util::File::JoinPath(path, "XXXXXX").c_str())};
  if (!data || mkdtemp(data.get()) == nullptr) return "";
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  CString data{strdup((path + ".XXXXXX").c_str())};
  if (!data) return -1;
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsWriteAll(int fd, const char* data, size_t size) {
  size_t pos = 0;
  while (pos < size) {
    ssize_t written = write(fd, data + pos, size - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& contents,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  int err = OsWriteAll(fd, contents.data(), contents.size());
  if (close(fd) == -1 && !err) err = errno;
  if (!err && overwrite && rename(temp_file.c_str(), path.c_str()) == -1) {
    err = errno;
  }
  if (!err && !overwrite && link(temp_file.c_str(), path.c_str()) == -1) {
    err = errno;
  }
  if (err || !overwrite) remove(temp_file.c_str());
  return err;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) {
    if (errno == ENOENT) throw file_not_found("Read " + path);
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::string contents;
  char buf[kChunkSize] = {};
  ssize_t amount;
  while ((amount = read(fd, buf, kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      int error = errno;
      close(fd);
      throw std::system_error(error, std::system_category(), "Read " + path);
    }
    contents.append(buf, amount);
  }
  close(fd);
  return contents;
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Exists(path)) throw file_exists("Write " + path);
  int err = OsWrite(path, contents, overwrite);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Copy(const std::string& from, const std::string& to,
                bool overwrite) {
  if (!IsRegularFile(from)) throw file_not_found("Copy " + from);
  Write(to, Read(from), overwrite);
  struct stat st {};
  if (stat(from.c_str(), &st) != -1) chmod(to.c_str(), st.st_mode & 07777);
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path))
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::vector<std::string> File::ListDir(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    if (errno == ENOENT) throw file_not_found("opendir " + path);
    throw std::system_error(errno, std::system_category(), "opendir " + path);
  }
  std::vector<std::string> entries;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    entries.push_back(name);
  }
  closedir(dir);
  return entries;
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0])) return second;
  if (!first.empty() && first.back() == kPathSeparators[0])
    return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return path;
  return path.substr(pos + 1);
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

bool File::Exists(const std::string& path) {
  struct stat buffer {};
  return stat(path.c_str(), &buffer) == 0;
}

bool File::IsDirectory(const std::string& path) {
  struct stat buffer {};
  return stat(path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode);
}

bool File::IsRegularFile(const std::string& path) {
  struct stat buffer {};
  return stat(path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode);
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (!keep_ && !path_.empty() && File::Exists(path_)) OsRemoveTree(path_);
}

}  // namespace util
