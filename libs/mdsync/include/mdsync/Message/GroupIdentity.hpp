#pragma once

#include <QString>
#include <QDebug>
#include <QHash>

#include "mdsync/common.pb.h"

namespace mdsync {

struct GroupIdentity {
    quint64 id = 0;
    QString creator;

    bool isValid() const { return id != 0 && !creator.isEmpty(); }

    static GroupIdentity fromProto(const proto::common::GroupIdentity& group);
    void toProto(proto::common::GroupIdentity* group) const;

    bool operator==(const GroupIdentity& other) const
    {
        return id == other.id && creator == other.creator;
    }
    bool operator!=(const GroupIdentity& other) const { return !(*this == other); }
};

inline size_t qHash(const GroupIdentity& group, size_t seed = 0) noexcept
{
    return ::qHash(group.id, seed) ^ ::qHash(group.creator, seed);
}

QDebug operator<<(QDebug debug, const GroupIdentity& group);

} // namespace mdsync
