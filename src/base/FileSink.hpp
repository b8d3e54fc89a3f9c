#ifndef __WT_FILE_SINK__
#define __WT_FILE_SINK__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Streaming destination for one received file.  Chunks are written as
 * they arrive so memory stays bounded by one chunk.
 */
class FileSink {
 public:
  virtual ~FileSink() {}

  /** @brief Appends a chunk.  Throws std::runtime_error on I/O failure. */
  virtual void write(const string& chunk) = 0;
  virtual void close() = 0;
};

class FileSinkProvider {
 public:
  virtual ~FileSinkProvider() {}

  /**
   * @brief Creates a sink for a file called `name`.  `totalSize` is -1 when
   * the size is not known yet.
   */
  virtual shared_ptr<FileSink> createSink(const string& name,
                                          int64_t totalSize) = 0;
};

class DiskFileSink : public FileSink {
 public:
  explicit DiskFileSink(const string& _path);
  virtual ~DiskFileSink();

  virtual void write(const string& chunk);
  virtual void close();

  const string& getPath() const { return path; }

 protected:
  string path;
  std::ofstream out;
};

/**
 * @brief Writes downloads into one directory.  Remote names are reduced to
 * their last path component so a download never lands outside `directory`.
 */
class DiskFileSinkProvider : public FileSinkProvider {
 public:
  explicit DiskFileSinkProvider(const string& _directory)
      : directory(_directory) {}

  virtual shared_ptr<FileSink> createSink(const string& name,
                                          int64_t totalSize);

  static string sanitizeFileName(const string& name);

 protected:
  string directory;
};
}  // namespace wt

#endif  // __WT_FILE_SINK__
