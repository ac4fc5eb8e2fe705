#pragma once
#include <fcntl.h>
#include <sys/stat.h>
#include <functional>
#include <string>

namespace caprec::file {

struct line_t {
  std::string txt;
  int lineno;
};

typedef struct stat stat_t;

class File {
 public:
  // borrows an already open descriptor, e.g. STDIN_FILENO; it is not closed
  explicit File(int fd, std::string name);

  explicit File(const std::string &path, int flags = O_RDONLY);

  File(const File &) = delete;

  ~File();

  void operator=(const File &) = delete;

  off_t Size() const;

  bool IsRegular() const;

  const std::string &Path() const { return path_; }

  std::string String() const;

  // calls back once per line, without the trailing newline
  void ReadLine(std::function<void(const line_t &)> &&callback) const;

 private:
  int fd_{-1};
  bool owned_{false};
  std::string path_{};

  const stat_t Status() const;
};
}  // namespace caprec::file
