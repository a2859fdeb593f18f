#pragma once
#include <stdint.h>
#include <stddef.h>
#include <array>
#include <vector>
#include <iostream>

namespace genibus {

// CRC-16-CCITT as used by GENIBus: poly 0x1021, preset 0xFFFF, inverted result.
// The start delimiter is not covered; the span runs from the length byte to the
// last APDU byte and the result is appended high byte first.
class CRC16
{
private:
    static constexpr std::array<uint16_t, 256> make_table()
    {
        std::array<uint16_t, 256> table{};
        for (int i = 0; i < 256; i++) {
            uint16_t fcs = static_cast<uint16_t>(i << 8);
            for (int j = 8; j > 0; j--) {
                if (fcs & 0x8000) fcs = static_cast<uint16_t>((fcs << 1) ^ 0x1021);
                else fcs = static_cast<uint16_t>(fcs << 1);
            }
            table[i] = fcs;
        }
        return table;
    }

public:
    static uint16_t calculate(const uint8_t* data, size_t len)
    {
        static constexpr std::array<uint16_t, 256> crc_table = make_table();

        uint16_t crc = 0xFFFF;
        for (size_t i = 0; i < len; i++)
            crc = static_cast<uint16_t>(crc_table[((crc >> 8) ^ data[i]) & 0xFF] ^ (crc << 8));
        return static_cast<uint16_t>(~crc);
    }

    // Checksum of a telegram without trailer.
    static uint16_t compute(const std::vector<uint8_t>& frame)
    {
        if (frame.size() < 2)
            return calculate(nullptr, 0);
        return calculate(frame.data() + 1, frame.size() - 1);
    }

    // Checks the trailing two bytes of a complete telegram. Never throws;
    // silent suppresses the diagnostic, used when the trailer may be absent.
    static bool verify(const std::vector<uint8_t>& frame, bool silent = false)
    {
        if (frame.size() < 3) {
            if (!silent)
                std::cerr << "[CRC] telegram too short: " << frame.size() << " bytes\n";
            return false;
        }

        size_t span = frame.size() - 2;
        uint16_t expected = calculate(frame.data() + 1, span - 1);
        uint16_t received = static_cast<uint16_t>((frame[span] << 8) | frame[span + 1]);
        if (expected != received) {
            if (!silent)
                std::cerr << "[CRC] mismatch: expected 0x" << std::hex << expected
                          << " got 0x" << received << std::dec << "\n";
            return false;
        }
        return true;
    }

    static std::vector<uint8_t> append(std::vector<uint8_t> frame)
    {
        uint16_t crc = compute(frame);
        frame.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));  // MSB
        frame.push_back(static_cast<uint8_t>(crc & 0xFF));         // LSB
        return frame;
    }

    static std::vector<uint8_t> strip(std::vector<uint8_t> frame)
    {
        if (frame.size() >= 2)
            frame.resize(frame.size() - 2);
        return frame;
    }
};

} // namespace genibus
