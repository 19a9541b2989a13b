#pragma once

#include <mdsync/Task/TaskDefinition.hpp>

#include <vector>

#include "mdsync/d2d.pb.h"
#include "mdsync/sync.pb.h"

namespace mdsync {

class EnvelopeBuilder;

/// Reflects state changes to the other devices inside a mediator
/// transaction. Requires multi-device to be active.
class TaskDefinitionSync : public TaskDefinition {
public:
    virtual proto::d2d::TransactionScope::Scope scope() const = 0;
    virtual bool buildEnvelopes(const EnvelopeBuilder& builder,
                                std::vector<proto::d2d::Envelope>& out,
                                Error* error = nullptr) const = 0;

    QString description() const override;
    std::shared_ptr<TaskExecution> createExecution(const TaskContext& context) override;

protected:
    TaskDefinitionSync()
        : TaskDefinition(TaskType::Persistent, false) {}

    virtual const char* name() const = 0;
};

class TaskDefinitionProfileSync : public TaskDefinitionSync {
public:
    explicit TaskDefinitionProfileSync(const proto::sync::UserProfile& profile)
        : profile_(profile) {}

    const proto::sync::UserProfile& profile() const { return profile_; }

    proto::d2d::TransactionScope::Scope scope() const override;
    bool buildEnvelopes(const EnvelopeBuilder& builder, std::vector<proto::d2d::Envelope>& out,
                        Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionProfileSync"; }

private:
    proto::sync::UserProfile profile_;
};

class TaskDefinitionSettingsSync : public TaskDefinitionSync {
public:
    explicit TaskDefinitionSettingsSync(const proto::sync::Settings& settings)
        : settings_(settings) {}

    const proto::sync::Settings& settings() const { return settings_; }

    proto::d2d::TransactionScope::Scope scope() const override;
    bool buildEnvelopes(const EnvelopeBuilder& builder, std::vector<proto::d2d::Envelope>& out,
                        Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSettingsSync"; }

private:
    proto::sync::Settings settings_;
};

/// One contact-sync update envelope per contact, all in one transaction.
class TaskDefinitionUpdateContactSync : public TaskDefinitionSync {
public:
    explicit TaskDefinitionUpdateContactSync(std::vector<proto::sync::Contact> contacts)
        : contacts_(std::move(contacts)) {}

    const std::vector<proto::sync::Contact>& contacts() const { return contacts_; }

    QString description() const override;
    proto::d2d::TransactionScope::Scope scope() const override;
    bool buildEnvelopes(const EnvelopeBuilder& builder, std::vector<proto::d2d::Envelope>& out,
                        Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionUpdateContactSync"; }

private:
    std::vector<proto::sync::Contact> contacts_;
};

class TaskDefinitionMdmParameterSync : public TaskDefinitionSync {
public:
    explicit TaskDefinitionMdmParameterSync(const proto::sync::MdmParameters& parameters)
        : parameters_(parameters) {}

    const proto::sync::MdmParameters& parameters() const { return parameters_; }

    proto::d2d::TransactionScope::Scope scope() const override;
    bool buildEnvelopes(const EnvelopeBuilder& builder, std::vector<proto::d2d::Envelope>& out,
                        Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionMdmParameterSync"; }

private:
    proto::sync::MdmParameters parameters_;
};

} // namespace mdsync
