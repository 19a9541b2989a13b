#pragma once

#include <mdsync/Crypto/RandomSource.hpp>
#include <mdsync/Message/ReflectionPolicy.hpp>

namespace mdsync {

class MediatorMessenger;
class IMessageStore;
class IIdentityStore;
class IContactCryptor;
class ReflectedMessageProcessor;
class EnvelopeBuilder;

/// Collaborators handed to task executions. The queue owns a copy; every
/// pointer must outlive the queue.
struct TaskContext {
    MediatorMessenger* messenger = nullptr;
    IMessageStore* store = nullptr;
    const IIdentityStore* identityStore = nullptr;
    IContactCryptor* contactCryptor = nullptr;
    ReflectedMessageProcessor* processor = nullptr;
    const EnvelopeBuilder* envelopeBuilder = nullptr;
    ReflectionPolicy reflectionPolicy;
    RandomSource random = systemRandomSource();
};

} // namespace mdsync
