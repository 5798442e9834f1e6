#include "util/file.hpp"

#include <cstdio>
#include <cstring>
#include <vector>

#include <errno.h>
#include <ftw.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back(0);
  if (mkdtemp(data.data()) == nullptr) return "";
  return data.data();
}

}  // namespace

namespace util {

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(), "removetree");
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0])) return second;
  if (first.empty()) return second;
  if (strchr(kPathSeparators, first.back())) return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseName(const std::string& path) {
  size_t end = path.find_last_not_of(kPathSeparators);
  if (end == std::string::npos) {
    // Either empty or made only of separators.
    return path.empty() ? path : std::string(1, kPathSeparators[0]);
  }
  std::string trimmed = path.substr(0, end + 1);
  return trimmed.substr(trimmed.find_last_of(kPathSeparators) + 1);
}

std::string File::StripExtension(const std::string& name) {
  return name.substr(0, name.find_last_of('.'));
}

bool File::Exists(const std::string& path) {
  struct stat buffer {};
  return stat(path.c_str(), &buffer) == 0;
}

bool File::IsExecutable(const std::string& path) {
  struct stat buffer {};
  if (stat(path.c_str(), &buffer) != 0) return false;
  if (!S_ISREG(buffer.st_mode)) return false;
  return access(path.c_str(), X_OK) == 0;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_) return;
  if (!OsRemoveTree(path_)) perror("removetree");
}

}  // namespace util
