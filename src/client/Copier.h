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

#ifndef DAISYCP_CLIENT_COPIER_H_
#define DAISYCP_CLIENT_COPIER_H_

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/CopyHandle.h"
#include "client/ObjectURL.h"
#include "data/DaisyChain.h"

namespace DC {

namespace Client {

class FetchClient;
class UploadClient;

//
// Daisy chain copy of an object, from a fetch client to an upload client.
//
// The source is pinned to the ETag seen at head time, so a source which
// changes in the middle of the copy fails the copy instead of producing a
// mixed object.
//
class Copier : private boost::noncopyable {
 public:
  // Throw DCException if any client is null
  Copier(const boost::shared_ptr<FetchClient> &fetchClient,
         const boost::shared_ptr<UploadClient> &uploadClient,
         const DC::Data::DaisyChainConfigure &configure =
             DC::Data::DaisyChainConfigure());

 public:
  // Copy source object to destination
  //
  // @param  : source url, destination url
  // @return : copy handle, finished when the call returns
  boost::shared_ptr<CopyHandle> Copy(const ObjectURL &source,
                                     const ObjectURL &dest);

 private:
  void DoCopy(const boost::shared_ptr<CopyHandle> &handle);
  void Fail(const boost::shared_ptr<CopyHandle> &handle,
            const ClientError<TransferError::Value> &err);

 private:
  boost::shared_ptr<FetchClient> m_fetchClient;
  boost::shared_ptr<UploadClient> m_uploadClient;
  DC::Data::DaisyChainConfigure m_configure;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_COPIER_H_
