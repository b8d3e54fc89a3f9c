#ifndef __WT_ENGINE_CONFIG__
#define __WT_ENGINE_CONFIG__

#include "Headers.hpp"
#include "WriteBuffer.hpp"

namespace wt {
/**
 * @brief Every tunable of the session engine.  The defaults match what the
 * backend proxy expects; an INI file and then the command line override them.
 */
struct EngineConfig {
  // [Network]
  string apiUrl = "http://localhost:3000";

  // [Terminal]
  string terminalType = "xterm-256color";
  string terminalLang = "zh_CN.UTF-8";
  string terminalLcAll = "zh_CN.UTF-8";
  string downloadDirectory = ".";

  // [Transfer]
  int64_t uploadChunkSize = 5 * 1024 * 1024;
  int64_t uploadStartDelayMs = 100;
  int64_t uploadChunkDelayMs = 50;
  int64_t maxOutboundBacklog = WriteBuffer::MAX_BUFFER_SIZE;
  int64_t uploadCompletionTimeoutMs = 5 * 60 * 1000;
  int64_t downloadSettleTimeoutMs = 10 * 1000;
  int64_t downloadPollIntervalMs = 50;
  int64_t zmodemChunkSize = 2 * 1024 * 1024;
  int64_t zmodemSubpacketSize = 8 * 1024;
  int64_t receiveProgressIntervalMs = 500;
  int64_t sendProgressIntervalMs = 300;

  // [Protocol]
  int64_t requestTimeoutMs = 30 * 1000;
  string uploadSuccessMessage = "文件上传成功";
  string uploadCancelledMessage = "上传已取消";
  string fileSavedMessage = "文件保存成功";

  // [Debug]
  int verbose = 0;
  string logDirectory = "";
  string maxLogSize = "20971520";
};

/**
 * @brief Reads `path` on top of the defaults.  Throws std::runtime_error when
 * the file cannot be loaded or a number does not parse.
 */
EngineConfig loadEngineConfig(const string& path);

/** @brief Same as loadEngineConfig, reading INI text from memory. */
EngineConfig parseEngineConfig(const string& iniData);
}  // namespace wt

#endif  // __WT_ENGINE_CONFIG__
