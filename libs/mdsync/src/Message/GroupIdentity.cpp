#include <mdsync/Message/GroupIdentity.hpp>

namespace mdsync {

GroupIdentity GroupIdentity::fromProto(const proto::common::GroupIdentity& group)
{
    return GroupIdentity{group.group_id(), QString::fromStdString(group.creator_identity())};
}

void GroupIdentity::toProto(proto::common::GroupIdentity* group) const
{
    group->set_group_id(id);
    group->set_creator_identity(creator.toStdString());
}

QDebug operator<<(QDebug debug, const GroupIdentity& group)
{
    QDebugStateSaver saver(debug);
    debug.nospace().noquote() << "group(" << QString::number(group.id, 16)
                              << ", " << group.creator << ")";
    return debug;
}

} // namespace mdsync
