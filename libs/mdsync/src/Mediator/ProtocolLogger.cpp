#include <mdsync/Mediator/ProtocolLogger.hpp>
#include <mdsync/Mediator/MediatorMessenger.hpp>
#include <mdsync/Frame/MediatorFrameType.hpp>
#include <mdsync/Version.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace mdsync {

namespace {

std::string hexPreview(const uint8_t* payload, size_t payloadSize, const char* separator)
{
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    const size_t previewLen = std::min(payloadSize, ProtocolLogger::PREVIEW_BYTES);
    for (size_t i = 0; i < previewLen; ++i) {
        if (i > 0) out << separator;
        out << std::setw(2) << static_cast<int>(payload[i]);
    }
    if (payloadSize > previewLen) out << "...";
    return out.str();
}

void logFrame(ProtocolLogger* logger, const char* direction, quint8 frameType,
              const QByteArray& frame)
{
    if (frame.size() <= MEDIATOR_COMMON_HEADER_LENGTH) {
        logger->log(direction, frameType, nullptr, 0);
        return;
    }
    logger->log(direction, frameType,
                reinterpret_cast<const uint8_t*>(frame.constData() + MEDIATOR_COMMON_HEADER_LENGTH),
                static_cast<size_t>(frame.size() - MEDIATOR_COMMON_HEADER_LENGTH));
}

} // namespace

ProtocolLogger::ProtocolLogger(QObject* parent)
    : QObject(parent)
{
}

ProtocolLogger::~ProtocolLogger()
{
    detach();
    close();
}

bool ProtocolLogger::open(const std::string& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) file_.close();
    file_.open(path, std::ios::trunc);
    startTime_ = std::chrono::steady_clock::now();
    open_ = file_.is_open();
    if (open_ && format_ == OutputFormat::Tsv) {
        file_ << "TIME\tDIR\tFRAME\tSIZE\tPAYLOAD_PREVIEW\n";
        file_.flush();
    }
    return open_;
}

void ProtocolLogger::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) { file_.close(); open_ = false; }
}

bool ProtocolLogger::isOpen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void ProtocolLogger::setFormat(OutputFormat format)
{
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

ProtocolLogger::OutputFormat ProtocolLogger::format() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return format_;
}

void ProtocolLogger::attach(MediatorMessenger* messenger)
{
    detach();
    messenger_ = messenger;
    if (!messenger_) return;

    connect(messenger_, &MediatorMessenger::frameReceived,
            this, [this](quint8 type, const QByteArray& frame) {
                logFrame(this, "Mediator->Device", type, frame);
            });
    connect(messenger_, &MediatorMessenger::frameSent,
            this, [this](quint8 type, const QByteArray& frame) {
                logFrame(this, "Device->Mediator", type, frame);
            });
}

void ProtocolLogger::detach()
{
    if (messenger_) {
        disconnect(messenger_, nullptr, this, nullptr);
        messenger_ = nullptr;
    }
}

void ProtocolLogger::log(const std::string& direction, uint8_t frameType,
                         const uint8_t* payload, size_t payloadSize)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) return;

    auto now = std::chrono::steady_clock::now();

    if (format_ == OutputFormat::Jsonl) {
        const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - startTime_).count();
        std::ostringstream line;
        line << "{\"ts_ms\":" << elapsedMs
             << ",\"direction\":\"" << direction << "\""
             << ",\"frame_type\":" << static_cast<int>(frameType)
             << ",\"frame_name\":\"" << frameName(frameType) << "\""
             << ",\"size\":" << payloadSize
             << ",\"payload_preview\":\"" << hexPreview(payload, payloadSize, "") << "\"}\n";
        file_ << line.str();
        file_.flush();
        return;
    }

    const auto elapsed = std::chrono::duration<double>(now - startTime_).count();

    std::ostringstream line;
    line << std::fixed << std::setprecision(3) << elapsed << '\t'
         << direction << '\t'
         << frameName(frameType) << '\t'
         << payloadSize << '\t'
         << hexPreview(payload, payloadSize, " ") << '\n';

    file_ << line.str();
    file_.flush();
}

std::string ProtocolLogger::frameName(uint8_t frameType)
{
    if (!isKnownFrameType(frameType)) {
        std::ostringstream out;
        out << "UNKNOWN(0x" << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(frameType) << ")";
        return out.str();
    }
    return frameTypeName(static_cast<MediatorFrameType>(frameType));
}

} // namespace mdsync
