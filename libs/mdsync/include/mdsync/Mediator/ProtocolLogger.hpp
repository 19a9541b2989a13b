#pragma once

#include <QObject>
#include <fstream>
#include <mutex>
#include <chrono>
#include <string>
#include <cstdint>

namespace mdsync {

class MediatorMessenger;

/// Logs mediator frames to a file, one line per frame.
/// Attach to a MediatorMessenger via attach(); it follows frameReceived and frameSent.
class ProtocolLogger : public QObject {
    Q_OBJECT

public:
    enum class OutputFormat {
        Tsv,
        Jsonl
    };

    static constexpr size_t PREVIEW_BYTES = 32;

    explicit ProtocolLogger(QObject* parent = nullptr);
    ~ProtocolLogger() override;

    bool open(const std::string& path = "/tmp/mdsync-protocol.log");
    void close();
    bool isOpen() const;

    void setFormat(OutputFormat format);
    OutputFormat format() const;

    void attach(MediatorMessenger* messenger);
    void detach();

    /// Manual log entry (direction: "Device->Mediator" or "Mediator->Device").
    /// Only the first PREVIEW_BYTES of the payload are written.
    void log(const std::string& direction, uint8_t frameType,
             const uint8_t* payload, size_t payloadSize);

    static std::string frameName(uint8_t frameType);

private:
    std::ofstream file_;
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point startTime_;
    bool open_ = false;
    OutputFormat format_ = OutputFormat::Tsv;
    MediatorMessenger* messenger_ = nullptr;
};

} // namespace mdsync
