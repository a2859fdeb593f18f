#pragma once
#include <stdint.h>
#include <stddef.h>

namespace genibus::Protocol
{
    // Timeouts (ms)
    constexpr int CONNECT_TIMEOUT_MS = 10000;
    constexpr int HANDSHAKE_TIMEOUT_MS = 5000;
    constexpr int POLL_TIMEOUT_MS = 10000;
    constexpr int COMMAND_TIMEOUT_MS = 5000;
    constexpr int SETUP_TIMEOUT_MS = 15000;
    constexpr int RECONNECT_BACKOFF_MS = 1000;

    // Start delimiters
    namespace FrameType {
        constexpr uint8_t DATA_REQUEST = 0x27;
        constexpr uint8_t DATA_REPLY = 0x24;
        constexpr uint8_t DATA_MESSAGE = 0x26;
    }

    constexpr bool is_start_delimiter(uint8_t byte)
    {
        return byte == FrameType::DATA_REQUEST ||
               byte == FrameType::DATA_REPLY ||
               byte == FrameType::DATA_MESSAGE;
    }

    // [SD][LEN][DA][SA] ... [CRC_HI][CRC_LO]
    constexpr size_t HEADER_SIZE = 4;
    constexpr size_t CRC_SIZE = 2;
    constexpr size_t ADDRESS_BYTES = 2;

    // LEN counts addresses + APDUs; whole telegram stays within 255 bytes
    constexpr size_t MAX_PDU_LEN = 0xFF - HEADER_SIZE;

    // Six bit length field in the APDU header
    constexpr size_t MAX_APDU_DATA = 0x3F;

    // Addresses
    constexpr uint8_t CONNECTION_REQ_ADDR = 0xFE;
    constexpr uint8_t DEFAULT_DEVICE_ADDR = 0x20;
    constexpr uint8_t DEFAULT_SOURCE_ADDR = 0x04;

    constexpr int DEFAULT_TCP_PORT = 502;
    constexpr int DEFAULT_BAUD = 9600;
    constexpr int DEFAULT_UPDATE_INTERVAL_SEC = 30;

    // APDU classes
    namespace Class {
        constexpr uint8_t PROTOCOL_DATA = 0;
        constexpr uint8_t BUS_DATA = 1;
        constexpr uint8_t MEASURED_DATA = 2;
        constexpr uint8_t COMMANDS = 3;
        constexpr uint8_t CONFIGURATION_PARAMETERS = 4;
        constexpr uint8_t REFERENCE_VALUES = 5;
        constexpr uint8_t TEST_DATA = 6;
        constexpr uint8_t ASCII_STRINGS = 7;
        constexpr uint8_t SIXTEENBIT_MEASURED_DATA = 11;
    }

    // Operation specifier, bits 7..6 of the second APDU byte
    namespace Operation {
        constexpr uint8_t GET = 0;
        constexpr uint8_t SET = 2;
        constexpr uint8_t INFO = 3;
    }

    // Reply acknowledge code, same bit position as the operation
    namespace Ack {
        constexpr uint8_t OK = 0;
        constexpr uint8_t UNKNOWN_CLASS = 1;
        constexpr uint8_t UNKNOWN_ID = 2;
        constexpr uint8_t ILLEGAL_OPERATION = 3;
    }

    constexpr int REFERENCE_MIN = 0;
    constexpr int REFERENCE_MAX = 100;

    constexpr const char* DEFAULT_FAMILY = "magna";
}
