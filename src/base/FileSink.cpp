#include "FileSink.hpp"

namespace wt {
DiskFileSink::DiskFileSink(const string& _path) : path(_path) {
  out.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Could not open " + path + " for writing");
  }
}

DiskFileSink::~DiskFileSink() {
  if (out.is_open()) {
    out.close();
  }
}

void DiskFileSink::write(const string& chunk) {
  out.write(chunk.data(), chunk.size());
  if (!out.good()) {
    throw std::runtime_error("Write to " + path + " failed");
  }
}

void DiskFileSink::close() {
  if (!out.is_open()) {
    return;
  }
  out.close();
  VLOG(1) << "Closed sink " << path;
}

string DiskFileSinkProvider::sanitizeFileName(const string& name) {
  string base = name;
  auto slash = base.find_last_of("/\\");
  if (slash != string::npos) {
    base = base.substr(slash + 1);
  }
  if (base.empty() || base == "." || base == "..") {
    base = "download";
  }
  return base;
}

shared_ptr<FileSink> DiskFileSinkProvider::createSink(const string& name,
                                                      int64_t totalSize) {
  fs::create_directories(directory);
  string path = directory + "/" + sanitizeFileName(name);
  LOG(INFO) << "Saving " << name << " (" << totalSize << " bytes) to " << path;
  return shared_ptr<FileSink>(new DiskFileSink(path));
}
}  // namespace wt
