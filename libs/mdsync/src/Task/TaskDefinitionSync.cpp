#include <mdsync/Task/TaskDefinitionSync.hpp>
#include <mdsync/Task/TaskExecutionSync.hpp>
#include <mdsync/Message/EnvelopeBuilder.hpp>

namespace mdsync {

QString TaskDefinitionSync::description() const
{
    return QStringLiteral("<%1>").arg(QLatin1String(name()));
}

std::shared_ptr<TaskExecution> TaskDefinitionSync::createExecution(const TaskContext& context)
{
    return std::make_shared<TaskExecutionSync>(self<TaskDefinitionSync>(), context);
}

// TaskDefinitionProfileSync

proto::d2d::TransactionScope::Scope TaskDefinitionProfileSync::scope() const
{
    return proto::d2d::TransactionScope::USER_PROFILE_SYNC;
}

bool TaskDefinitionProfileSync::buildEnvelopes(const EnvelopeBuilder& builder,
                                               std::vector<proto::d2d::Envelope>& out,
                                               Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!builder.userProfileSync(profile_, envelope, error))
        return false;
    out.push_back(std::move(envelope));
    return true;
}

void TaskDefinitionProfileSync::encodeDefinition(proto::task::TaskRecord& record) const
{
    *record.mutable_profile_sync()->mutable_profile() = profile_;
}

// TaskDefinitionSettingsSync

proto::d2d::TransactionScope::Scope TaskDefinitionSettingsSync::scope() const
{
    return proto::d2d::TransactionScope::SETTINGS_SYNC;
}

bool TaskDefinitionSettingsSync::buildEnvelopes(const EnvelopeBuilder& builder,
                                                std::vector<proto::d2d::Envelope>& out,
                                                Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!builder.settingsSync(settings_, envelope, error))
        return false;
    out.push_back(std::move(envelope));
    return true;
}

void TaskDefinitionSettingsSync::encodeDefinition(proto::task::TaskRecord& record) const
{
    *record.mutable_settings_sync()->mutable_settings() = settings_;
}

// TaskDefinitionUpdateContactSync

QString TaskDefinitionUpdateContactSync::description() const
{
    return QStringLiteral("<%1 %2 contacts>")
        .arg(QLatin1String(name()))
        .arg(static_cast<int>(contacts_.size()));
}

proto::d2d::TransactionScope::Scope TaskDefinitionUpdateContactSync::scope() const
{
    return proto::d2d::TransactionScope::CONTACT_SYNC;
}

bool TaskDefinitionUpdateContactSync::buildEnvelopes(const EnvelopeBuilder& builder,
                                                     std::vector<proto::d2d::Envelope>& out,
                                                     Error* error) const
{
    std::vector<proto::d2d::Envelope> envelopes;
    envelopes.reserve(contacts_.size());
    for (const proto::sync::Contact& contact : contacts_) {
        proto::d2d::Envelope envelope;
        if (!builder.contactSync(contact, false, envelope, error))
            return false;
        envelopes.push_back(std::move(envelope));
    }
    out = std::move(envelopes);
    return true;
}

void TaskDefinitionUpdateContactSync::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_update_contact_sync();
    for (const proto::sync::Contact& contact : contacts_)
        *definition->add_contacts() = contact;
}

// TaskDefinitionMdmParameterSync

proto::d2d::TransactionScope::Scope TaskDefinitionMdmParameterSync::scope() const
{
    return proto::d2d::TransactionScope::MDM_PARAMETER_SYNC;
}

bool TaskDefinitionMdmParameterSync::buildEnvelopes(const EnvelopeBuilder& builder,
                                                    std::vector<proto::d2d::Envelope>& out,
                                                    Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!builder.mdmParameterSync(parameters_, envelope, error))
        return false;
    out.push_back(std::move(envelope));
    return true;
}

void TaskDefinitionMdmParameterSync::encodeDefinition(proto::task::TaskRecord& record) const
{
    *record.mutable_mdm_parameter_sync()->mutable_parameters() = parameters_;
}

} // namespace mdsync
