#include "util/file.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>

#include "glog/logging.h"

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";
static const constexpr size_t kReadChunkSize = 32 * 1024;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

// Programs under evaluation may chmod their own directories, which would make
// the removal fail.
bool OsRestorePermissions(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) {
                if (typeflags == FTW_D || typeflags == FTW_DNR) {
                  chmod(fpath, S_IRWXU);
                }
                return 0;
              },
              64, FTW_PHYS | FTW_MOUNT) != -1;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& contents) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                S_IRUSR | S_IWUSR);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      return error;
    }
    pos += written;
  }
  return close(fd) == -1 ? errno : 0;
}

// Returns errno, or 0 on success.
int OsRead(const std::string& path, int64_t limit, std::string* contents,
           bool* truncated) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[kReadChunkSize] = {};
  ssize_t amount;
  *truncated = false;
  while ((amount = read(fd, buf, kReadChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    int64_t room = limit - static_cast<int64_t>(contents->size());
    if (amount > room) {
      contents->append(buf, room);
      *truncated = true;
      break;
    }
    contents->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

}  // namespace
#endif

namespace util {

std::string File::Read(const std::string& path, int64_t limit,
                       bool* truncated) {
  std::string contents;
  bool was_truncated = false;
  int err = OsRead(path, limit, &contents, &was_truncated);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  if (truncated) *truncated = was_truncated;
  return contents;
}

void File::Write(const std::string& path, const std::string& contents) {
  MakeDirs(BaseDir(path));
  int err = OsWrite(path, contents);
  if (err) throw std::system_error(err, std::system_category(), "Write " + path);
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

void File::Remove(const std::string& path) {
  if (!OsRemove(path))
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  OsRestorePermissions(path);
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  return path.substr(0, path.find_last_of(kPathSeparators));
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp " + base);
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (moved_) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Unable to remove " << path_ << ": " << e.what();
  }
}

}  // namespace util
