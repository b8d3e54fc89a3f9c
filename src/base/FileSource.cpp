#include "FileSource.hpp"

namespace wt {
DiskFileSource::DiskFileSource(const string& _path) : path(_path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    throw std::runtime_error("Cannot stat " + path + ": " + strerror(errno));
  }
  if (!S_ISREG(st.st_mode)) {
    throw std::runtime_error(path + " is not a regular file");
  }
  name = fs::path(path).filename().string();
  size = st.st_size;
  modifiedTime = st.st_mtime;
  mode = st.st_mode & 07777;
  in.open(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Could not open " + path + " for reading");
  }
}

string DiskFileSource::read(int64_t offset, int64_t length) {
  if (offset >= size || length <= 0) {
    return "";
  }
  length = std::min(length, size - offset);
  string buf(length, '\0');
  in.clear();
  in.seekg(offset);
  in.read(&buf[0], length);
  if (in.gcount() != length) {
    throw std::runtime_error("Short read from " + path);
  }
  return buf;
}
}  // namespace wt
