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

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "app/Parser.h"
#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Size.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace {

using DC::App::Parser::Parse;
using DC::Configure::Options;
using DC::Exception::DCException;
using DC::Logging::LogLevel;
using std::string;
using std::vector;

// Build argv for Parse, the strings must outlive the returned pointers
class CommandLine {
 public:
  explicit CommandLine(const char *args) {
    m_args.push_back("daisycp");
    string arg;
    for (const char *p = args; *p != '\0'; ++p) {
      if (*p == ' ') {
        if (!arg.empty()) {
          m_args.push_back(arg);
          arg.clear();
        }
      } else {
        arg += *p;
      }
    }
    if (!arg.empty()) {
      m_args.push_back(arg);
    }
    for (vector<string>::iterator it = m_args.begin(); it != m_args.end();
         ++it) {
      m_argv.push_back(&(*it)[0]);
    }
    m_argv.push_back(NULL);
  }

  int argc() const { return static_cast<int>(m_args.size()); }
  char **argv() { return &m_argv[0]; }

 private:
  vector<string> m_args;
  vector<char *> m_argv;
};

void ParseLine(const char *args) {
  CommandLine cmd(args);
  Parse(cmd.argc(), cmd.argv());
}

}  // namespace

TEST(ParserTest, Locations) {
  ParseLine("qs://src/a.bin qs://dst/b.bin");
  const Options &options = Options::Instance();
  EXPECT_EQ(options.GetSource(), string("qs://src/a.bin"));
  EXPECT_EQ(options.GetDestination(), string("qs://dst/b.bin"));
  EXPECT_FALSE(options.IsNoCopy());
}

TEST(ParserTest, Defaults) {
  using namespace DC::Configure::Default;  // NOLINT
  ParseLine("qs://src/a.bin qs://dst/b.bin");
  const Options &options = Options::Instance();
  EXPECT_EQ(options.GetFetchRangeSize(), DC::Size::MB100);
  EXPECT_EQ(options.GetMaxBufferedBytes(), DC::Size::MB1);
  EXPECT_EQ(options.GetTransferChunkSize(), GetDefaultTransferChunkSize());
  EXPECT_EQ(options.GetUploadPartSize(), GetDefaultUploadPartSize());
  EXPECT_EQ(options.GetRetries(), GetDefaultTransactionRetries());
  EXPECT_EQ(options.GetProtocol(), GetDefaultProtocolName());
  EXPECT_EQ(options.GetPort(), GetDefaultPort(GetDefaultProtocolName()));
  EXPECT_EQ(options.GetCredentialsFile(), GetDefaultCredentialsFile());
  EXPECT_EQ(options.GetLogLevel(), LogLevel::Warn);
  EXPECT_FALSE(options.IsForeground());
  EXPECT_FALSE(options.IsDebug());
}

TEST(ParserTest, TransferSizes) {
  ParseLine("--range 10 --buffer 2048 --chunk 16 --partsize 8 "
            "qs://src/a qs://dst/b");
  const Options &options = Options::Instance();
  EXPECT_EQ(options.GetFetchRangeSize(), 10 * DC::Size::MB1);
  EXPECT_EQ(options.GetMaxBufferedBytes(), 2 * DC::Size::MB1);
  EXPECT_EQ(options.GetTransferChunkSize(), 16 * DC::Size::KB1);
  EXPECT_EQ(options.GetUploadPartSize(), 8 * DC::Size::MB1);
}

TEST(ParserTest, InvalidValuesFallBackToDefaults) {
  using namespace DC::Configure::Default;  // NOLINT
  ParseLine("--range=0 --buffer=-1 --chunk 4096 --partsize 1 -r 0 "
            "-p ftp -P 70000 -L verbose qs://src/a qs://dst/b");
  const Options &options = Options::Instance();
  EXPECT_EQ(options.GetFetchRangeSize(), GetDefaultFetchRangeSize());
  EXPECT_EQ(options.GetMaxBufferedBytes(), GetDefaultMaxBufferedBytes());
  // chunk larger than buffer
  EXPECT_EQ(options.GetTransferChunkSize(), GetDefaultTransferChunkSize());
  EXPECT_EQ(options.GetUploadPartSize(), GetDefaultUploadPartSize());
  EXPECT_EQ(options.GetRetries(), GetDefaultTransactionRetries());
  EXPECT_EQ(options.GetProtocol(), GetDefaultProtocolName());
  EXPECT_EQ(options.GetPort(), GetDefaultPort(GetDefaultProtocolName()));
  EXPECT_EQ(options.GetLogLevel(), LogLevel::Warn);
}

TEST(ParserTest, ChunkFitsSmallBuffer) {
  ParseLine("--buffer=4 --chunk=0 qs://src/a qs://dst/b");
  const Options &options = Options::Instance();
  EXPECT_EQ(options.GetMaxBufferedBytes(), 4 * DC::Size::KB1);
  EXPECT_EQ(options.GetTransferChunkSize(), 4 * DC::Size::KB1);

  ParseLine("--buffer=4 --chunk=16 qs://src/a qs://dst/b");
  EXPECT_EQ(options.GetTransferChunkSize(), 4 * DC::Size::KB1);

  ParseLine("--buffer=4 --chunk=2 qs://src/a qs://dst/b");
  EXPECT_EQ(options.GetTransferChunkSize(), 2 * DC::Size::KB1);
}

TEST(ParserTest, Connection) {
  ParseLine("-z sh1a -H example.com -p http -a tester -c /tmp/cred "
            "qs://src/a qs://dst/b");
  const Options &options = Options::Instance();
  EXPECT_EQ(options.GetZone(), string("sh1a"));
  EXPECT_EQ(options.GetHost(), string("example.com"));
  EXPECT_EQ(options.GetProtocol(), string("http"));
  EXPECT_EQ(options.GetPort(), 80);
  EXPECT_EQ(options.GetAdditionalAgent(), string("tester"));
  EXPECT_EQ(options.GetCredentialsFile(), string("/tmp/cred"));
}

TEST(ParserTest, Switches) {
  ParseLine("-f -d -C -L error qs://src/a qs://dst/b");
  const Options &options = Options::Instance();
  EXPECT_TRUE(options.IsForeground());
  EXPECT_TRUE(options.IsDebug());
  EXPECT_TRUE(options.IsClearLogDir());
  EXPECT_EQ(options.GetLogLevel(), LogLevel::Error);
}

TEST(ParserTest, HelpAndVersion) {
  ParseLine("-h");
  EXPECT_TRUE(Options::Instance().IsShowHelp());
  EXPECT_TRUE(Options::Instance().IsNoCopy());
  ParseLine("--version");
  EXPECT_TRUE(Options::Instance().IsShowVersion());
  EXPECT_FALSE(Options::Instance().IsShowHelp());
}

TEST(ParserTest, BadCommandLine) {
  EXPECT_THROW(ParseLine("qs://a/x qs://b/y qs://c/z"), DCException);
  EXPECT_THROW(ParseLine("--nosuchoption qs://a/x qs://b/y"), DCException);
  EXPECT_THROW(ParseLine("--range ten qs://a/x qs://b/y"), DCException);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
