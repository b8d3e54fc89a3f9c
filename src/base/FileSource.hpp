#ifndef __WT_FILE_SOURCE__
#define __WT_FILE_SOURCE__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Random-access file contents offered for sending.
 */
class FileSource {
 public:
  virtual ~FileSource() {}

  virtual string getName() = 0;
  virtual int64_t getSize() = 0;
  /** @brief Modification time in seconds since the epoch. */
  virtual int64_t getModifiedTime() = 0;
  virtual int getMode() = 0;
  /**
   * @brief Reads up to `length` bytes starting at `offset`.  Returns fewer
   * bytes only at the end of the file.
   */
  virtual string read(int64_t offset, int64_t length) = 0;
};

class DiskFileSource : public FileSource {
 public:
  explicit DiskFileSource(const string& _path);

  virtual string getName() { return name; }
  virtual int64_t getSize() { return size; }
  virtual int64_t getModifiedTime() { return modifiedTime; }
  virtual int getMode() { return mode; }
  virtual string read(int64_t offset, int64_t length);

 protected:
  string path;
  string name;
  int64_t size;
  int64_t modifiedTime;
  int mode;
  std::ifstream in;
};

class MemoryFileSource : public FileSource {
 public:
  MemoryFileSource(const string& _name, const string& _contents,
                   int64_t _modifiedTime = 0, int _mode = 0644)
      : name(_name),
        contents(_contents),
        modifiedTime(_modifiedTime),
        mode(_mode) {}

  virtual string getName() { return name; }
  virtual int64_t getSize() { return contents.size(); }
  virtual int64_t getModifiedTime() { return modifiedTime; }
  virtual int getMode() { return mode; }
  virtual string read(int64_t offset, int64_t length) {
    if (offset >= (int64_t)contents.size()) {
      return "";
    }
    return contents.substr(offset, length);
  }

 protected:
  string name;
  string contents;
  int64_t modifiedTime;
  int mode;
};
}  // namespace wt

#endif  // __WT_FILE_SOURCE__
