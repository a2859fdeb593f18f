#include "transport/frame_receiver.hpp"
#include "common/crc16.hpp"
#include "common/protocol.hpp"
#include <chrono>

namespace genibus {

namespace {

// Once the delimiter is in, running out of time means a truncated telegram
Error after_delimiter(Error error)
{
    return error == Error::TIMEOUT ? Error::INCOMPLETE_FRAME : error;
}

} // anonymous namespace

Result<std::vector<uint8_t>> FrameReceiver::receive(ByteStream& stream, int timeout_ms)
{
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    auto remaining_ms = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    };

    std::vector<uint8_t> frame;
    Error failure = Error::INVALID_RESPONSE;
    Stage stage = Stage::AWAIT_DELIMITER;

    while (stage != Stage::DONE && stage != Stage::FAILED) {
        switch (stage) {
        case Stage::AWAIT_DELIMITER: {
            auto sd = stream.read_exact(1, remaining_ms());
            if (!sd.ok()) {
                failure = sd.error();
                stage = Stage::FAILED;
                break;
            }
            if (sd.value().empty()) {
                failure = Error::TIMEOUT;
                stage = Stage::FAILED;
                break;
            }
            if (!Protocol::is_start_delimiter(sd.value()[0])) {
                failure = Error::INVALID_DELIMITER;
                stage = Stage::FAILED;
                break;
            }
            frame.push_back(sd.value()[0]);
            stage = Stage::AWAIT_LENGTH;
            break;
        }
        case Stage::AWAIT_LENGTH: {
            auto len = stream.read_exact(1, remaining_ms());
            if (!len.ok()) {
                failure = after_delimiter(len.error());
                stage = Stage::FAILED;
                break;
            }
            if (len.value().empty()) {
                failure = Error::INCOMPLETE_FRAME;
                stage = Stage::FAILED;
                break;
            }
            uint8_t length = len.value()[0];
            if (length > Protocol::MAX_PDU_LEN || length < Protocol::ADDRESS_BYTES) {
                failure = Error::INVALID_LENGTH;
                stage = Stage::FAILED;
                break;
            }
            frame.push_back(length);
            stage = Stage::AWAIT_BODY;
            break;
        }
        case Stage::AWAIT_BODY: {
            size_t body_len = static_cast<size_t>(frame[1]) + Protocol::CRC_SIZE;
            auto body = stream.read_exact(body_len, remaining_ms());
            if (!body.ok()) {
                failure = after_delimiter(body.error());
                stage = Stage::FAILED;
                break;
            }
            if (body.value().size() != body_len) {
                failure = Error::INCOMPLETE_FRAME;
                stage = Stage::FAILED;
                break;
            }
            frame.insert(frame.end(), body.value().begin(), body.value().end());
            stage = Stage::VALIDATE;
            break;
        }
        case Stage::VALIDATE:
            if (!CRC16::verify(frame, true)) {
                failure = Error::CRC_MISMATCH;
                stage = Stage::FAILED;
                break;
            }
            stage = Stage::DONE;
            break;
        case Stage::DONE:
        case Stage::FAILED:
            break;
        }
    }

    if (stage == Stage::FAILED) {
        return Result<std::vector<uint8_t>>::failure(failure);
    }
    return Result<std::vector<uint8_t>>::success(std::move(frame));
}

} // namespace genibus
