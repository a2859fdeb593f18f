#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <stdint.h>

#include "common/crc16.hpp"
#include "common/protocol.hpp"

namespace genibus::testing {

/**
 * @brief Builds a checksummed telegram: [sd][len][body...][crc_hi][crc_lo]
 */
inline std::vector<uint8_t> make_telegram(uint8_t sd, const std::vector<uint8_t>& body)
{
    std::vector<uint8_t> frame;
    frame.push_back(sd);
    frame.push_back(static_cast<uint8_t>(body.size()));
    frame.insert(frame.end(), body.begin(), body.end());
    return CRC16::append(std::move(frame));
}

/**
 * @brief Simulated CU300 on the far side of a fake stream
 *
 * Answers every request by walking its APDUs: GET blocks get one byte per id
 * (two for 16 bit measurements, NUL terminated text for strings), SET and INFO
 * blocks get an empty acknowledge block carrying set_ack. Counters and the event trail are
 * shared by all streams created for the link, so tests can follow reconnects.
 */
struct FakeLink
{
    std::mutex mutex;

    // Device data by (class, id)
    std::map<std::pair<uint8_t, uint8_t>, uint8_t> values;
    std::map<uint8_t, uint16_t> sixteen_bit;
    std::map<uint8_t, std::string> strings;
    uint8_t device_addr = Protocol::DEFAULT_DEVICE_ADDR;

    // Behaviour switches
    bool auto_reply = true;
    bool fail_connect = false;
    bool fail_reads = false;
    int fail_write_at = -1;     // 1 based, counted over all streams
    int drop_replies = 0;       // next N requests go unanswered
    std::deque<std::vector<uint8_t>> scripted;  // raw answers, used before auto_reply
    uint8_t set_ack = Protocol::Ack::OK;    // ack code for SET and command blocks
    std::chrono::milliseconds read_delay{0};

    // What happened
    std::deque<uint8_t> rx;
    std::vector<std::vector<uint8_t>> writes;
    std::vector<std::string> events;
    int write_count = 0;
    int connects = 0;
    int streams_created = 0;

    void set_value(uint8_t klass, uint8_t id, uint8_t value)
    {
        values[{klass, id}] = value;
    }

    std::vector<uint8_t> respond(const std::vector<uint8_t>& request) const
    {
        std::vector<uint8_t> body;
        uint8_t dest = request[2];
        uint8_t source = request[3];
        body.push_back(source);
        body.push_back(dest == Protocol::CONNECTION_REQ_ADDR ? device_addr : dest);

        size_t pos = Protocol::HEADER_SIZE;
        const size_t end = request.size() - Protocol::CRC_SIZE;
        while (pos + 2 <= end) {
            uint8_t klass = request[pos];
            uint8_t op = request[pos + 1] >> 6;
            size_t len = request[pos + 1] & 0x3F;
            const uint8_t* ids = request.data() + pos + 2;
            pos += 2 + len;

            std::vector<uint8_t> data;
            if (op == Protocol::Operation::GET) {
                for (size_t i = 0; i < len; i++) {
                    uint8_t id = ids[i];
                    if (klass == Protocol::Class::SIXTEENBIT_MEASURED_DATA) {
                        auto it = sixteen_bit.find(id);
                        uint16_t v = it == sixteen_bit.end() ? 0 : it->second;
                        data.push_back(static_cast<uint8_t>(v >> 8));
                        data.push_back(static_cast<uint8_t>(v & 0xFF));
                    } else if (klass == Protocol::Class::ASCII_STRINGS) {
                        auto it = strings.find(id);
                        if (it != strings.end()) {
                            data.insert(data.end(), it->second.begin(), it->second.end());
                        }
                        data.push_back(0);
                    } else {
                        auto it = values.find({klass, id});
                        data.push_back(it == values.end() ? 0 : it->second);
                    }
                }
            }

            uint8_t ack = op == Protocol::Operation::GET ? Protocol::Ack::OK : set_ack;
            body.push_back(klass);
            body.push_back(static_cast<uint8_t>((ack << 6) | (data.size() & 0x3F)));
            body.insert(body.end(), data.begin(), data.end());
        }

        return make_telegram(Protocol::FrameType::DATA_REPLY, body);
    }
};

} // namespace genibus::testing
