#pragma once

#include <mdsync/Store/IMessageStore.hpp>

#include "mdsync/common.pb.h"

namespace mdsync {

class IBlobLoader {
public:
    virtual ~IBlobLoader() = default;

    virtual void requestDownload(const proto::common::Blob& blob,
                                 const ConversationContext& conversation,
                                 quint64 messageId) = 0;
};

} // namespace mdsync
