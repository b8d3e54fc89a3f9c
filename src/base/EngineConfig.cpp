#include "EngineConfig.hpp"

#include "SimpleIni.h"

namespace wt {
namespace {
void readString(const CSimpleIniA& ini, const char* section, const char* key,
                string* value) {
  const char* s = ini.GetValue(section, key, NULL);
  if (s) {
    *value = string(s);
  }
}

void readInt(const CSimpleIniA& ini, const char* section, const char* key,
             int64_t* value) {
  const char* s = ini.GetValue(section, key, NULL);
  if (!s) {
    return;
  }
  try {
    *value = std::stoll(s);
  } catch (const std::exception& e) {
    throw std::runtime_error(string("Invalid value for ") + section + "." +
                             key + ": " + s);
  }
  if (*value < 0) {
    throw std::runtime_error(string("Negative value for ") + section + "." +
                             key);
  }
}

EngineConfig readEngineConfig(const CSimpleIniA& ini) {
  EngineConfig config;
  readString(ini, "Network", "api_url", &config.apiUrl);

  readString(ini, "Terminal", "term", &config.terminalType);
  readString(ini, "Terminal", "lang", &config.terminalLang);
  readString(ini, "Terminal", "lc_all", &config.terminalLcAll);
  readString(ini, "Terminal", "download_dir", &config.downloadDirectory);

  readInt(ini, "Transfer", "upload_chunk_size", &config.uploadChunkSize);
  readInt(ini, "Transfer", "upload_start_delay_ms",
          &config.uploadStartDelayMs);
  readInt(ini, "Transfer", "upload_chunk_delay_ms",
          &config.uploadChunkDelayMs);
  readInt(ini, "Transfer", "max_outbound_backlog",
          &config.maxOutboundBacklog);
  readInt(ini, "Transfer", "upload_timeout_ms",
          &config.uploadCompletionTimeoutMs);
  readInt(ini, "Transfer", "download_settle_timeout_ms",
          &config.downloadSettleTimeoutMs);
  readInt(ini, "Transfer", "download_poll_interval_ms",
          &config.downloadPollIntervalMs);
  readInt(ini, "Transfer", "zmodem_chunk_size", &config.zmodemChunkSize);
  readInt(ini, "Transfer", "zmodem_subpacket_size",
          &config.zmodemSubpacketSize);
  readInt(ini, "Transfer", "receive_progress_interval_ms",
          &config.receiveProgressIntervalMs);
  readInt(ini, "Transfer", "send_progress_interval_ms",
          &config.sendProgressIntervalMs);
  if (config.uploadChunkSize == 0 || config.zmodemChunkSize == 0 ||
      config.zmodemSubpacketSize == 0) {
    throw std::runtime_error("Chunk sizes must be positive");
  }

  readInt(ini, "Protocol", "request_timeout_ms", &config.requestTimeoutMs);
  readString(ini, "Protocol", "upload_success_message",
             &config.uploadSuccessMessage);
  readString(ini, "Protocol", "upload_cancelled_message",
             &config.uploadCancelledMessage);
  readString(ini, "Protocol", "file_saved_message", &config.fileSavedMessage);

  int64_t verbose = config.verbose;
  readInt(ini, "Debug", "verbose", &verbose);
  config.verbose = int(verbose);
  readString(ini, "Debug", "logdir", &config.logDirectory);
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config.maxLogSize = string(logsize);
  }
  return config;
}
}  // namespace

EngineConfig loadEngineConfig(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }
  return readEngineConfig(ini);
}

EngineConfig parseEngineConfig(const string& iniData) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(iniData);
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  return readEngineConfig(ini);
}
}  // namespace wt
