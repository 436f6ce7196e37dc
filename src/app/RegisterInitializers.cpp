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

#include <sstream>
#include <string>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "app/Initializer.h"
#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "client/ClientConfiguration.h"
#include "client/Credentials.h"
#include "configure/Options.h"

using DC::App::Initializer;
using DC::App::InitStep;
using DC::App::Priority;
using DC::Client::ClientConfiguration;
using DC::Client::DefaultCredentialsProvider;
using DC::Client::InitializeClientConfiguration;
using DC::Client::InitializeCredentialsProvider;
using DC::Configure::Options;
using DC::Exception::DCException;
using DC::Utils::FileExists;
using std::string;

// --------------------------------------------------------------------------
void LoggingInitializer() {
  const Options &options = Options::Instance();
  DC::Logging::Log &log = DC::Logging::Log::Instance();
  // foreground logs to stderr
  string logdir = options.IsForeground() ? string() : options.GetLogDirectory();
  log.Initialize(logdir, options.GetMaxLogSizeInMB());
  log.SetDebug(options.IsDebug());
  log.SetLogLevel(options.GetLogLevel());
  if (options.IsClearLogDir() && !logdir.empty()) {
    log.ClearLogDirectory();
  }
}

// --------------------------------------------------------------------------
void CredentialsInitializer() {
  const Options &options = Options::Instance();
  const string &file = options.GetCredentialsFile();
  if (!FileExists(file)) {
    throw DCException("credentials file " + file + " does not exist");
  }
  InitializeCredentialsProvider(
      boost::make_shared<DefaultCredentialsProvider>(file));
}

// --------------------------------------------------------------------------
void ClientConfigurationInitializer() {
  // null provider falls back to the process wide credentials provider
  InitializeClientConfiguration(boost::make_shared<ClientConfiguration>());
  ClientConfiguration::Instance().InitializeByOptions();
}

// --------------------------------------------------------------------------
void PrintCommandLineOptions() {
  std::stringstream ss;
  ss << "<<Command Line Options>> " << Options::Instance();
  DebugInfo(ss.str());
}

namespace {

static Initializer logInitializer(InitStep(Priority::First, "logging",
                                           LoggingInitializer));
static Initializer credentialsInitializer(
    InitStep(Priority::Second, "credentials", CredentialsInitializer));
static Initializer clientConfigInitializer(
    InitStep(Priority::Third, "client configuration",
             ClientConfigurationInitializer));
// after logging is ready
static Initializer printOptionsInitializer(
    InitStep(Priority::Fourth, "print options", PrintCommandLineOptions));

}  // namespace
