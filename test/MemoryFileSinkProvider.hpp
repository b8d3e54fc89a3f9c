#ifndef __WT_MEMORY_FILE_SINK_PROVIDER__
#define __WT_MEMORY_FILE_SINK_PROVIDER__

#include "FileSink.hpp"

namespace wt {
class MemoryFileSink : public FileSink {
 public:
  MemoryFileSink() : closed(false) {}

  virtual void write(const string& chunk) {
    if (closed) {
      throw std::runtime_error("write after close");
    }
    contents += chunk;
  }
  virtual void close() { closed = true; }

  string contents;
  bool closed;
};

class MemoryFileSinkProvider : public FileSinkProvider {
 public:
  MemoryFileSinkProvider() : failCreate(false) {}

  virtual shared_ptr<FileSink> createSink(const string& name,
                                          int64_t totalSize) {
    if (failCreate) {
      throw std::runtime_error("Cannot create " + name);
    }
    shared_ptr<MemoryFileSink> sink(new MemoryFileSink());
    sinks[name] = sink;
    return sink;
  }

  shared_ptr<MemoryFileSink> get(const string& name) {
    auto it = sinks.find(name);
    return it == sinks.end() ? shared_ptr<MemoryFileSink>() : it->second;
  }

  map<string, shared_ptr<MemoryFileSink>> sinks;
  bool failCreate;
};
}  // namespace wt

#endif  // __WT_MEMORY_FILE_SINK_PROVIDER__
