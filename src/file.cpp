#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exceptions.hpp>
#include <file.hpp>
#include <logger.hpp>
#include <sstream>
#include <utils.hpp>

using caprec::file::File;

File::File(int fd, std::string name) : fd_{fd}, path_{std::move(name)} {}

File::File(const std::string &path, int flags)
    : owned_{true}, path_{path} {
  fd_ = open(path.c_str(), flags);
  if (fd_ < 0) {
    throw caprec::IOError("error opening '%s': %s", path.c_str(),
                          std::strerror(errno));
  }
  logger::debug() << "opened " << String() << std::endl;
}

File::~File() {
  if (!owned_ || fd_ < 0) {
    return;
  }
  if (close(fd_) < 0) {
    logger::error() << "error closing " << String() << ": "
                    << std::strerror(errno) << std::endl;
  }
}

off_t File::Size() const { return Status().st_size; }

bool File::IsRegular() const { return S_ISREG(Status().st_mode); }

std::string File::String() const {
  std::ostringstream ss;
  ss << "'" << path_ << "' (fd " << fd_ << ")";
  return ss.str();
}

void File::ReadLine(std::function<void(const line_t &)> &&callback) const {
  // the stream owns the duplicate, so fclose leaves fd_ open
  int dupfd = dup(fd_);
  if (dupfd < 0) {
    throw caprec::IOError("error duplicating fd %d: %s", fd_,
                          std::strerror(errno));
  }
  FILE *f = fdopen(dupfd, "r");
  if (f == nullptr) {
    close(dupfd);
    throw caprec::IOError("error opening fd %d for reading: %s", fd_,
                          std::strerror(errno));
  }
  DEFER(fclose(f));

  size_t len{0};
  ssize_t read{0};
  char *line = nullptr;
  DEFER(free(line));
  for (int lineno = 1; (read = getline(&line, &len, f)) != -1; lineno++) {
    std::string txt{line, static_cast<size_t>(read)};
    while (!txt.empty() && (txt.back() == '\n' || txt.back() == '\r')) {
      txt.pop_back();
    }
    callback(line_t{txt, lineno});
  }

  if (ferror(f) != 0) {
    throw caprec::IOError("error reading %s", String().c_str());
  }
}

const caprec::file::stat_t File::Status() const {
  stat_t st{};
  if (fstat(fd_, &st) != 0) {
    throw caprec::IOError("could not get file %d status: %s", fd_,
                          std::strerror(errno));
  }
  return st;
}
