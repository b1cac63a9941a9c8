/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file fs.hpp
 * @brief Small POSIX filesystem helpers: directory walk, mkdir -p, copy.
 */

#ifndef ITEST_FS_HPP_
#define ITEST_FS_HPP_

#include "itest/text.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace itest {
namespace detail {

// ============================================================================
// DirGuard - RAII wrapper for DIR*
// ============================================================================

class DirGuard {
 public:
  explicit DirGuard(DIR* dir) : dir_(dir) {}
  ~DirGuard() {
    if (dir_) {
      closedir(dir_);
    }
  }
  DIR* get() const { return dir_; }

  DirGuard(const DirGuard&) = delete;
  DirGuard& operator=(const DirGuard&) = delete;

 private:
  DIR* dir_;
};

class FdGuard {
 public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0) (void)::close(fd_);
  }
  int get() const { return fd_; }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

 private:
  int fd_;
};

// ============================================================================
// Queries
// ============================================================================

inline bool PathExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

inline bool IsDirectory(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

/// @brief True for a symbolic link itself, whatever it points to.
inline bool IsSymlink(const std::string& path) {
  struct stat st;
  return ::lstat(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
}

inline bool IsRegularFile(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

/// @brief Canonical absolute path, or empty if @p path does not resolve.
inline std::string RealPath(const std::string& path) {
  char buf[PATH_MAX];
  if (::realpath(path.c_str(), buf) == nullptr) return std::string();
  return buf;
}

/// @brief Last path component ("a/b/" -> "b").
inline std::string BaseName(const std::string& path) {
  size_t end = path.size();
  while (end > 1U && path[end - 1U] == '/') --end;
  size_t slash = path.rfind('/', end - 1U);
  if (slash == std::string::npos) return path.substr(0, end);
  return path.substr(slash + 1U, end - slash - 1U);
}

/// @brief Entries of @p dir excluding "." and "..", in readdir order.
inline std::vector<std::string> ListDir(const std::string& dir) {
  std::vector<std::string> names;
  DirGuard d(opendir(dir.c_str()));
  if (!d.get()) return names;
  struct dirent* entry;
  while ((entry = readdir(d.get())) != nullptr) {
    const char* n = entry->d_name;
    if (n[0] == '.' && (n[1] == '\0' || (n[1] == '.' && n[2] == '\0'))) continue;
    names.emplace_back(n);
  }
  return names;
}

// ============================================================================
// Mutations
// ============================================================================

/// @brief mkdir -p. Returns false and keeps errno on failure.
inline bool MakeDirs(const std::string& path, mode_t mode = 0755) {
  if (path.empty()) return false;
  if (IsDirectory(path)) return true;
  size_t pos = 0;
  while ((pos = path.find('/', pos + 1U)) != std::string::npos) {
    std::string prefix = path.substr(0, pos);
    if (::mkdir(prefix.c_str(), mode) != 0 && errno != EEXIST) return false;
  }
  if (::mkdir(path.c_str(), mode) != 0 && errno != EEXIST) return false;
  return IsDirectory(path);
}

inline bool CopyFile(const std::string& src, const std::string& dst) {
  struct stat st;
  if (::stat(src.c_str(), &st) != 0) return false;
  FdGuard in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
  if (in.get() < 0) return false;
  FdGuard out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     st.st_mode & 07777));
  if (out.get() < 0) return false;

  char buf[16384];
  for (;;) {
    ssize_t n = ::read(in.get(), buf, sizeof(buf));
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    ssize_t off = 0;
    while (off < n) {
      ssize_t w = ::write(out.get(), buf + off, static_cast<size_t>(n - off));
      if (w < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      off += w;
    }
  }
  return true;
}

/// @brief Copy a file, or a directory recursively, to @p dst.
inline bool CopyTree(const std::string& src, const std::string& dst) {
  if (!IsDirectory(src)) return CopyFile(src, dst);
  struct stat st;
  if (::stat(src.c_str(), &st) != 0) return false;
  if (::mkdir(dst.c_str(), st.st_mode & 07777) != 0 && errno != EEXIST) {
    return false;
  }
  for (const std::string& name : ListDir(src)) {
    if (!CopyTree(JoinPath(src, name), JoinPath(dst, name))) return false;
  }
  return true;
}

}  // namespace detail
}  // namespace itest

#endif  // ITEST_FS_HPP_
