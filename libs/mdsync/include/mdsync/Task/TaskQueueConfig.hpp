#pragma once

#include <QString>

namespace mdsync {

struct TaskQueueConfig {
    QString path;                 // empty: no persistence
    int backoffInitialMs = 500;
    int backoffMaxMs = 8000;
    int maxRetries = 5;
    int reflectAckTimeoutMs = 20000;
};

} // namespace mdsync
