#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <stdint.h>

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "common/catalog.hpp"

namespace genibus {

struct Header
{
    uint8_t start_delimiter = Protocol::FrameType::DATA_REQUEST;
    uint8_t dest_addr = Protocol::DEFAULT_DEVICE_ADDR;
    uint8_t source_addr = Protocol::DEFAULT_SOURCE_ADDR;
};

// Data points to GET (or INFO), grouped by APDU class. Empty groups are skipped.
struct ValueRequest
{
    std::vector<std::string> protocol_data;
    std::vector<std::string> parameters;
    std::vector<std::string> measurements;
    std::vector<std::string> references;
    std::vector<std::string> strings;

    // MEASURED_DATA or SIXTEENBIT_MEASURED_DATA
    uint8_t measurement_class = Protocol::Class::MEASURED_DATA;
};

using Assignment = std::pair<std::string, uint8_t>;

struct ValueAssignment
{
    std::vector<Assignment> parameters;
    std::vector<Assignment> references;
};

struct ReplyData
{
    Values values;
    std::map<std::string, std::string> strings;
};

// Builds and parses GENIBus telegrams:
//   [SD][LEN][DA][SA][APDU...][CRC_HI][CRC_LO]
//   APDU = [class][(op << 6) | len][data...]
class GenibusFrame
{
public:
    explicit GenibusFrame(std::shared_ptr<const Catalog> catalog,
                          std::string family = Protocol::DEFAULT_FAMILY);

    Result<std::vector<uint8_t>> build_get_values(const Header& header, const ValueRequest& request) const;
    Result<std::vector<uint8_t>> build_set_values(const Header& header, const ValueAssignment& values) const;
    Result<std::vector<uint8_t>> build_set_commands(const Header& header, const std::vector<std::string>& commands) const;
    Result<std::vector<uint8_t>> build_get_info(const Header& header, const ValueRequest& request) const;
    Result<std::vector<uint8_t>> build_set_remote(const Header& header) const;
    Result<std::vector<uint8_t>> build_connect_request(uint8_t source_addr) const;

    // Decodes a reply against the GET request that produced it.
    Result<ReplyData> parse(const std::vector<uint8_t>& reply, const ValueRequest& request) const;

    // Checks a reply to a SET or command telegram: framing, one block per
    // request block with the same class in the same order, and the ack code
    // of every block. Block contents are not interpreted.
    Result<bool> check_ack(const std::vector<uint8_t>& reply, const std::vector<uint8_t>& request) const;

    // What the handshake asks for; also used to decode its reply.
    static ValueRequest connect_request();

    const std::string& family() const { return family_; }

private:
    std::shared_ptr<const Catalog> catalog_;
    std::string family_;

    Result<std::vector<uint8_t>> build_apdu(uint8_t klass, uint8_t op, const std::vector<std::string>& names) const;
    Result<std::vector<uint8_t>> build_apdu(uint8_t klass, uint8_t op, const std::vector<Assignment>& values) const;
    Result<std::vector<uint8_t>> assemble(const Header& header, const std::vector<std::vector<uint8_t>>& apdus) const;
};

} // namespace genibus
