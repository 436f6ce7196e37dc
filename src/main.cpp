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

#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "boost/shared_ptr.hpp"

#include "app/HelpText.h"
#include "app/Initializer.h"
#include "app/Parser.h"
#include "base/Exception.h"
#include "base/LogMacros.h"
#include "client/Copier.h"
#include "client/CopyHandle.h"
#include "client/ObjectURL.h"
#include "client/QSFetchClient.h"
#include "client/QSService.h"
#include "client/QSUploadClient.h"
#include "configure/Default.h"
#include "configure/Options.h"

using boost::shared_ptr;
using DC::App::HelpText::ShowDaisycpHelp;
using DC::App::HelpText::ShowDaisycpUsage;
using DC::App::HelpText::ShowDaisycpVersion;
using DC::App::Initializer;
using DC::Client::Copier;
using DC::Client::CopyHandle;
using DC::Client::ObjectURL;
using DC::Client::ParseObjectURL;
using DC::Client::QSFetchClient;
using DC::Client::QSService;
using DC::Client::QSUploadClient;
using DC::Configure::Default::GetProgramName;
using DC::Configure::Options;
using DC::Exception::DCException;
using std::pair;
using std::string;

namespace {

void PrintError(const char *err) {
  std::cerr << "[" << GetProgramName() << " ERROR] " << err << "\n";
}

ObjectURL CheckLocation(const string &location, const char *what) {
  if (location.empty()) {
    ShowDaisycpUsage();
    throw DCException(string("Missing ") + what + " parameter");
  }
  ObjectURL url;
  pair<bool, string> outcome = ParseObjectURL(location, &url);
  if (!outcome.first) {
    throw DCException(outcome.second);
  }
  return url;
}

// Stop sdk when leaving scope
struct ServiceGuard {
  ServiceGuard() { QSService::Instance().Start(); }
  ~ServiceGuard() { QSService::Instance().Stop(); }
};

}  // namespace

int main(int argc, char **argv) {
  try {
    DC::App::Parser::Parse(argc, argv);
  } catch (const DCException &err) {
    PrintError(err.what());
    return 1;
  }

  const Options &options = Options::Instance();
  int ret = 0;
  try {
    if (options.IsNoCopy()) {
      if (options.IsShowVersion()) {
        ShowDaisycpVersion();
      }
      if (options.IsShowHelp()) {
        ShowDaisycpHelp();
      }
      return 0;
    }

    ObjectURL source = CheckLocation(options.GetSource(), "SOURCE");
    ObjectURL dest = CheckLocation(options.GetDestination(), "DESTINATION");

    // Notice: DO NOT use logging before initialization done.
    Initializer::RunInitializers();

    ServiceGuard service;
    shared_ptr<QSFetchClient> fetchClient;
    shared_ptr<QSUploadClient> uploadClient;
    QSService::Instance().MakeCopyClients(source.GetBucket(), dest.GetBucket(),
                                          &fetchClient, &uploadClient);

    Copier copier(fetchClient, uploadClient);
    shared_ptr<CopyHandle> handle = copier.Copy(source, dest);
    if (handle->IsCompleted()) {
      std::cout << "Copied " << source.ToString() << " to " << dest.ToString()
                << " [bytes=" << handle->GetBytesCopied() << "]\n";
    } else {
      Error(handle->ToString());
      PrintError(handle->ToString().c_str());
      ret = 1;
    }
  } catch (const DCException &err) {
    PrintError(err.what());
    ret = 1;
  } catch (const std::exception &err) {
    PrintError(err.what());
    ret = 1;
  }
  return ret;
}
