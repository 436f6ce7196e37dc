// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef DAISYCP_CONFIGURE_OPTIONS_H_
#define DAISYCP_CONFIGURE_OPTIONS_H_

#include <stdint.h>  // for uint16_t

#include <ostream>
#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

namespace DC {

namespace App {
namespace Parser {
void Parse(int argc, char **argv);

}  // namespace Parser
}  // namespace App

namespace Configure {

using DC::Logging::LogLevel;

class Options : public Singleton<Options> {
 public:
  ~Options() {}

 public:
  bool IsNoCopy() const { return m_showHelp || m_showVersion; }

  // accessor
  const std::string &GetSource() const { return m_source; }
  const std::string &GetDestination() const { return m_destination; }
  const std::string &GetZone() const { return m_zone; }
  const std::string &GetCredentialsFile() const { return m_credentialsFile; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  int GetMaxLogSizeInMB() const { return m_maxLogSizeInMB; }
  uint16_t GetRetries() const { return m_retries; }
  uint32_t GetRequestTimeOut() const { return m_requestTimeOut; }
  uint64_t GetFetchRangeSize() const { return m_fetchRangeSize; }
  uint64_t GetMaxBufferedBytes() const { return m_maxBufferedBytes; }
  uint64_t GetTransferChunkSize() const { return m_transferChunkSize; }
  uint64_t GetUploadPartSize() const { return m_uploadPartSize; }
  const std::string &GetHost() const { return m_host; }
  const std::string &GetProtocol() const { return m_protocol; }
  uint16_t GetPort() const { return m_port; }
  const std::string &GetAdditionalAgent() const { return m_additionalAgent; }
  bool IsClearLogDir() const { return m_clearLogDir; }
  bool IsForeground() const { return m_foreground; }
  bool IsDebug() const { return m_debug; }
  bool IsShowHelp() const { return m_showHelp; }
  bool IsShowVersion() const { return m_showVersion; }

 private:
  Options();

  // mutator
  void SetSource(const std::string &source) { m_source = source; }
  void SetDestination(const std::string &dest) { m_destination = dest; }
  void SetZone(const std::string &zone) { m_zone = zone; }
  void SetCredentialsFile(const std::string &file) { m_credentialsFile = file; }
  void SetLogDirectory(const std::string &path) { m_logDirectory = path; }
  void SetLogLevel(LogLevel::Value level) { m_logLevel = level; }
  void SetMaxLogSizeInMB(int size) { m_maxLogSizeInMB = size; }
  void SetRetries(uint16_t retries) { m_retries = retries; }
  void SetRequestTimeOut(uint32_t timeout) { m_requestTimeOut = timeout; }
  void SetFetchRangeSize(uint64_t size) { m_fetchRangeSize = size; }
  void SetMaxBufferedBytes(uint64_t size) { m_maxBufferedBytes = size; }
  void SetTransferChunkSize(uint64_t size) { m_transferChunkSize = size; }
  void SetUploadPartSize(uint64_t size) { m_uploadPartSize = size; }
  void SetHost(const std::string &host) { m_host = host; }
  void SetProtocol(const std::string &protocol) { m_protocol = protocol; }
  void SetPort(uint16_t port) { m_port = port; }
  void SetAdditionalAgent(const std::string &agent) {
    m_additionalAgent = agent;
  }
  void SetClearLogDir(bool clearLogDir) { m_clearLogDir = clearLogDir; }
  void SetForeground(bool foreground) { m_foreground = foreground; }
  void SetDebug(bool debug) { m_debug = debug; }
  void SetShowHelp(bool showHelp) { m_showHelp = showHelp; }
  void SetShowVersion(bool showVersion) { m_showVersion = showVersion; }

  std::string m_source;       // qs://bucket/key[#etag]
  std::string m_destination;  // qs://bucket/key
  std::string m_zone;
  std::string m_credentialsFile;
  std::string m_logDirectory;
  LogLevel::Value m_logLevel;
  int m_maxLogSizeInMB;
  uint16_t m_retries;           // transaction retries
  uint32_t m_requestTimeOut;    // in seconds
  uint64_t m_fetchRangeSize;    // in bytes
  uint64_t m_maxBufferedBytes;  // in bytes
  uint64_t m_transferChunkSize;  // in bytes
  uint64_t m_uploadPartSize;     // in bytes
  std::string m_host;
  std::string m_protocol;
  uint16_t m_port;
  std::string m_additionalAgent;
  bool m_clearLogDir;
  bool m_foreground;  // log to stderr
  bool m_debug;
  bool m_showHelp;
  bool m_showVersion;

  friend class Singleton<Options>;
  friend void DC::App::Parser::Parse(int argc, char **argv);
  friend class OptionsTest;
  friend std::ostream &operator<<(std::ostream &os, const Options &opts);
};

std::ostream &operator<<(std::ostream &os, const Options &opts);

}  // namespace Configure
}  // namespace DC

#endif  // DAISYCP_CONFIGURE_OPTIONS_H_
