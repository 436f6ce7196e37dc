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

#include "client/Copier.h"

#include <stdint.h>

#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/FetchClient.h"
#include "client/UploadClient.h"
#include "data/DaisyChain.h"

namespace DC {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using DC::Data::DaisyChain;
using DC::Data::DaisyChainConfigure;
using DC::Exception::DCException;
using DC::StringUtils::FormatObject;

// --------------------------------------------------------------------------
Copier::Copier(const shared_ptr<FetchClient> &fetchClient,
               const shared_ptr<UploadClient> &uploadClient,
               const DaisyChainConfigure &configure)
    : m_fetchClient(fetchClient),
      m_uploadClient(uploadClient),
      m_configure(configure) {
  if (!m_fetchClient || !m_uploadClient) {
    throw DCException("Copier is initialized with null client");
  }
}

// --------------------------------------------------------------------------
shared_ptr<CopyHandle> Copier::Copy(const ObjectURL &source,
                                    const ObjectURL &dest) {
  shared_ptr<CopyHandle> handle = boost::make_shared<CopyHandle>(source, dest);
  if (!source.IsValid() || !dest.IsValid()) {
    Fail(handle, ClientError<TransferError::Value>(
                     TransferError::PARAMETER_INVALID, "Copy",
                     FormatObject(source.ToString(), dest.ToString()), false));
    return handle;
  }

  handle->UpdateStatus(CopyStatus::InProgress);
  try {
    DoCopy(handle);
  } catch (const DCException &e) {
    // usage error of the stream, such as an unsupported seek
    Fail(handle, ClientError<TransferError::Value>(
                     TransferError::PARAMETER_INVALID, "Copy", e.get(),
                     false));
  }
  return handle;
}

// --------------------------------------------------------------------------
void Copier::DoCopy(const shared_ptr<CopyHandle> &handle) {
  const ObjectURL &source = handle->GetSource();
  const ObjectURL &dest = handle->GetDestination();

  // fetch client retries head by itself
  ObjectInfo info;
  ClientError<TransferError::Value> err =
      m_fetchClient->HeadObject(source, &info);
  if (!IsGoodTransferError(err)) {
    Fail(handle, err);
    return;
  }
  if (source.HasGeneration() && info.eTag != source.GetGeneration()) {
    Fail(handle, ClientError<TransferError::Value>(
                     TransferError::SOURCE_CHANGED, "Copy",
                     "generation " + source.GetGeneration() + " not match " +
                         info.eTag + " " + FormatObject(source.ToString()),
                     false));
    return;
  }
  handle->SetBytesTotalSize(info.size);
  Info("Start copy " + FormatObject(source.ToString(), dest.ToString()) +
       " [size=" + to_string(info.size) + "]");

  uint64_t uploaded = 0;
  {
    DaisyChain chain(source.WithGeneration(info.eTag), info.size,
                     m_fetchClient, m_configure);
    err = m_uploadClient->UploadObject(dest, &chain, &uploaded);
  }
  handle->SetBytesCopied(uploaded);
  if (!IsGoodTransferError(err)) {
    Fail(handle, err);
    return;
  }
  if (uploaded != info.size) {
    Fail(handle, ClientError<TransferError::Value>(
                     TransferError::SHORT_READ, "Copy",
                     "uploaded " + to_string(uploaded) + " of " +
                         to_string(info.size) + " bytes",
                     false));
    return;
  }

  handle->UpdateStatus(CopyStatus::Completed);
  Info("Finish copy " + FormatObject(source.ToString(), dest.ToString()) +
       " [bytes=" + to_string(uploaded) + "]");
}

// --------------------------------------------------------------------------
void Copier::Fail(const shared_ptr<CopyHandle> &handle,
                  const ClientError<TransferError::Value> &err) {
  handle->SetError(err);
  handle->UpdateStatus(CopyStatus::Failed);
  Error("Fail to copy " +
        FormatObject(handle->GetSource().ToString(),
                     handle->GetDestination().ToString()) +
        " " + GetMessageForTransferError(err));
}

}  // namespace Client
}  // namespace DC
