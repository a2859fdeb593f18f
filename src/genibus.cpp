#include "transport/genibus.hpp"
#include "common/crc16.hpp"

namespace genibus {

namespace {

struct ExpectedBlock
{
    uint8_t klass;
    const std::vector<std::string>* names;
};

// Wire order of the class blocks inside one telegram
std::vector<ExpectedBlock> blocks_in_wire_order(const ValueRequest& request)
{
    std::vector<ExpectedBlock> blocks;
    if (!request.protocol_data.empty())
        blocks.push_back({Protocol::Class::PROTOCOL_DATA, &request.protocol_data});
    if (!request.parameters.empty())
        blocks.push_back({Protocol::Class::CONFIGURATION_PARAMETERS, &request.parameters});
    if (!request.measurements.empty())
        blocks.push_back({request.measurement_class, &request.measurements});
    if (!request.references.empty())
        blocks.push_back({Protocol::Class::REFERENCE_VALUES, &request.references});
    if (!request.strings.empty())
        blocks.push_back({Protocol::Class::ASCII_STRINGS, &request.strings});
    return blocks;
}

bool is_measurement_class(uint8_t klass)
{
    return klass == Protocol::Class::MEASURED_DATA ||
           klass == Protocol::Class::SIXTEENBIT_MEASURED_DATA;
}

// Splits NUL separated strings, one per requested name
void decode_strings(const uint8_t* data, size_t len, const std::vector<std::string>& names,
                    std::map<std::string, std::string>& out)
{
    size_t index = 0;
    std::string current;
    for (size_t i = 0; i < len && index < names.size(); i++) {
        if (data[i] == 0) {
            out[names[index++]] = current;
            current.clear();
        } else {
            current.push_back(static_cast<char>(data[i]));
        }
    }
    if (!current.empty() && index < names.size()) {
        out[names[index]] = current;
    }
}

// Telegram level checks shared by every reply decoder
Result<bool> check_framing(const std::vector<uint8_t>& reply)
{
    if (reply.size() < Protocol::HEADER_SIZE + Protocol::CRC_SIZE) {
        return Result<bool>::failure(Error::INVALID_LENGTH);
    }

    if (!CRC16::verify(reply, true)) {
        return Result<bool>::failure(Error::CRC_MISMATCH);
    }

    if (!Protocol::is_start_delimiter(reply[0])) {
        return Result<bool>::failure(Error::INVALID_DELIMITER);
    }

    // LEN excludes SD, LEN itself and the CRC
    if (static_cast<size_t>(reply[1]) + 2 + Protocol::CRC_SIZE != reply.size()) {
        return Result<bool>::failure(Error::INVALID_LENGTH);
    }
    return Result<bool>::success(true);
}

} // anonymous namespace

GenibusFrame::GenibusFrame(std::shared_ptr<const Catalog> catalog, std::string family)
    : catalog_(std::move(catalog)), family_(std::move(family))
{
}

ValueRequest GenibusFrame::connect_request()
{
    ValueRequest request;
    request.protocol_data = {"buf_len", "unit_bus_mode"};
    request.parameters = {"unit_addr", "group_addr"};
    request.measurements = {"unit_family", "unit_type"};
    return request;
}

Result<std::vector<uint8_t>> GenibusFrame::build_apdu(uint8_t klass, uint8_t op, const std::vector<std::string>& names) const
{
    if (names.size() > Protocol::MAX_APDU_DATA) {
        return Result<std::vector<uint8_t>>::failure(Error::INVALID_LENGTH);
    }

    std::vector<uint8_t> apdu;
    apdu.push_back(klass);
    apdu.push_back(static_cast<uint8_t>((op << 6) | (names.size() & 0x3F)));

    for (const auto& name : names) {
        auto point = catalog_->lookup(family_, klass, name);
        if (!point.ok()) {
            return Result<std::vector<uint8_t>>::failure(point.error());
        }
        apdu.push_back(point.value().id);
    }
    return Result<std::vector<uint8_t>>::success(std::move(apdu));
}

Result<std::vector<uint8_t>> GenibusFrame::build_apdu(uint8_t klass, uint8_t op, const std::vector<Assignment>& values) const
{
    size_t data_len = values.size() * 2;
    if (data_len > Protocol::MAX_APDU_DATA) {
        return Result<std::vector<uint8_t>>::failure(Error::INVALID_LENGTH);
    }

    std::vector<uint8_t> apdu;
    apdu.push_back(klass);
    apdu.push_back(static_cast<uint8_t>((op << 6) | (data_len & 0x3F)));

    for (const auto& [name, value] : values) {
        auto point = catalog_->lookup(family_, klass, name);
        if (!point.ok()) {
            return Result<std::vector<uint8_t>>::failure(point.error());
        }
        apdu.push_back(point.value().id);
        apdu.push_back(value);
    }
    return Result<std::vector<uint8_t>>::success(std::move(apdu));
}

Result<std::vector<uint8_t>> GenibusFrame::assemble(const Header& header, const std::vector<std::vector<uint8_t>>& apdus) const
{
    size_t length = Protocol::ADDRESS_BYTES;
    for (const auto& apdu : apdus) {
        length += apdu.size();
    }
    if (length > Protocol::MAX_PDU_LEN) {
        return Result<std::vector<uint8_t>>::failure(Error::INVALID_LENGTH);
    }

    std::vector<uint8_t> frame;
    frame.reserve(length + Protocol::HEADER_SIZE);
    frame.push_back(header.start_delimiter);
    frame.push_back(static_cast<uint8_t>(length));
    frame.push_back(header.dest_addr);
    frame.push_back(header.source_addr);
    for (const auto& apdu : apdus) {
        frame.insert(frame.end(), apdu.begin(), apdu.end());
    }

    return Result<std::vector<uint8_t>>::success(CRC16::append(std::move(frame)));
}

Result<std::vector<uint8_t>> GenibusFrame::build_get_values(const Header& header, const ValueRequest& request) const
{
    if (!request.measurements.empty() && !is_measurement_class(request.measurement_class)) {
        return Result<std::vector<uint8_t>>::failure(Error::INVALID_REQUEST);
    }

    std::vector<std::vector<uint8_t>> apdus;
    for (const auto& block : blocks_in_wire_order(request)) {
        auto apdu = build_apdu(block.klass, Protocol::Operation::GET, *block.names);
        if (!apdu.ok()) {
            return apdu;
        }
        apdus.push_back(apdu.value());
    }
    return assemble(header, apdus);
}

Result<std::vector<uint8_t>> GenibusFrame::build_set_values(const Header& header, const ValueAssignment& values) const
{
    std::vector<std::vector<uint8_t>> apdus;

    if (!values.parameters.empty()) {
        auto apdu = build_apdu(Protocol::Class::CONFIGURATION_PARAMETERS, Protocol::Operation::SET, values.parameters);
        if (!apdu.ok()) {
            return apdu;
        }
        apdus.push_back(apdu.value());
    }

    if (!values.references.empty()) {
        auto apdu = build_apdu(Protocol::Class::REFERENCE_VALUES, Protocol::Operation::SET, values.references);
        if (!apdu.ok()) {
            return apdu;
        }
        apdus.push_back(apdu.value());
    }

    return assemble(header, apdus);
}

Result<std::vector<uint8_t>> GenibusFrame::build_set_commands(const Header& header, const std::vector<std::string>& commands) const
{
    // commands carry no value, the id alone triggers them
    auto apdu = build_apdu(Protocol::Class::COMMANDS, Protocol::Operation::SET, commands);
    if (!apdu.ok()) {
        return apdu;
    }
    return assemble(header, {apdu.value()});
}

Result<std::vector<uint8_t>> GenibusFrame::build_get_info(const Header& header, const ValueRequest& request) const
{
    if (!request.measurements.empty() && !is_measurement_class(request.measurement_class)) {
        return Result<std::vector<uint8_t>>::failure(Error::INVALID_REQUEST);
    }

    // INFO is defined for measurements, parameters and references only
    ValueRequest info;
    info.parameters = request.parameters;
    info.measurements = request.measurements;
    info.references = request.references;
    info.measurement_class = request.measurement_class;

    std::vector<std::vector<uint8_t>> apdus;
    for (const auto& block : blocks_in_wire_order(info)) {
        auto apdu = build_apdu(block.klass, Protocol::Operation::INFO, *block.names);
        if (!apdu.ok()) {
            return apdu;
        }
        apdus.push_back(apdu.value());
    }
    return assemble(header, apdus);
}

Result<std::vector<uint8_t>> GenibusFrame::build_set_remote(const Header& header) const
{
    return build_set_commands(header, {"REMOTE"});
}

Result<std::vector<uint8_t>> GenibusFrame::build_connect_request(uint8_t source_addr) const
{
    Header header;
    header.start_delimiter = Protocol::FrameType::DATA_REQUEST;
    header.dest_addr = Protocol::CONNECTION_REQ_ADDR;
    header.source_addr = source_addr;
    return build_get_values(header, connect_request());
}

Result<ReplyData> GenibusFrame::parse(const std::vector<uint8_t>& reply, const ValueRequest& request) const
{
    auto framing = check_framing(reply);
    if (!framing.ok()) {
        return Result<ReplyData>::failure(framing.error());
    }

    ReplyData data;
    size_t pos = Protocol::HEADER_SIZE;
    const size_t end = reply.size() - Protocol::CRC_SIZE;

    for (const auto& block : blocks_in_wire_order(request)) {
        if (pos + 2 > end) {
            return Result<ReplyData>::failure(Error::PARSE_ERROR);
        }

        uint8_t klass = reply[pos];
        uint8_t ack = reply[pos + 1] >> 6;
        size_t len = reply[pos + 1] & 0x3F;
        pos += 2;

        if (klass != block.klass) {
            return Result<ReplyData>::failure(Error::PARSE_ERROR);
        }
        if (ack != Protocol::Ack::OK) {
            return Result<ReplyData>::failure(Error::DEVICE_ERROR);
        }
        if (pos + len > end) {
            return Result<ReplyData>::failure(Error::PARSE_ERROR);
        }

        if (klass == Protocol::Class::ASCII_STRINGS) {
            decode_strings(reply.data() + pos, len, *block.names, data.strings);
            pos += len;
            continue;
        }

        std::vector<DataPoint> points;
        size_t expected_len = 0;
        for (const auto& name : *block.names) {
            auto point = catalog_->lookup(family_, klass, name);
            if (!point.ok()) {
                return Result<ReplyData>::failure(point.error());
            }
            expected_len += point.value().width;
            points.push_back(point.value());
        }

        // an empty block carries no values; nothing is filled in for them
        if (len != 0) {
            if (len != expected_len) {
                return Result<ReplyData>::failure(Error::PARSE_ERROR);
            }
            size_t offset = pos;
            for (const auto& point : points) {
                data.values[point.name] = point.decode(reply.data() + offset);
                offset += point.width;
            }
        }
        pos += len;
    }

    if (pos != end) {
        return Result<ReplyData>::failure(Error::PARSE_ERROR);
    }

    return Result<ReplyData>::success(std::move(data));
}

Result<bool> GenibusFrame::check_ack(const std::vector<uint8_t>& reply, const std::vector<uint8_t>& request) const
{
    auto framing = check_framing(reply);
    if (!framing.ok()) {
        return framing;
    }

    // classes the request asked about, in telegram order
    std::vector<uint8_t> expected;
    size_t pos = Protocol::HEADER_SIZE;
    const size_t request_end = request.size() >= Protocol::HEADER_SIZE + Protocol::CRC_SIZE
        ? request.size() - Protocol::CRC_SIZE : 0;
    while (pos + 2 <= request_end) {
        expected.push_back(request[pos]);
        pos += 2 + (request[pos + 1] & 0x3F);
    }
    if (expected.empty()) {
        return Result<bool>::failure(Error::INVALID_REQUEST);
    }

    pos = Protocol::HEADER_SIZE;
    const size_t end = reply.size() - Protocol::CRC_SIZE;
    size_t block = 0;
    while (pos < end) {
        if (pos + 2 > end) {
            return Result<bool>::failure(Error::PARSE_ERROR);
        }
        uint8_t klass = reply[pos];
        uint8_t ack = reply[pos + 1] >> 6;
        size_t len = reply[pos + 1] & 0x3F;

        // a reply to some other telegram is not an acknowledge of this one
        if (block >= expected.size() || klass != expected[block]) {
            return Result<bool>::failure(Error::INVALID_RESPONSE);
        }
        if (ack != Protocol::Ack::OK) {
            return Result<bool>::failure(Error::DEVICE_ERROR);
        }
        pos += 2 + len;
        block++;
    }

    if (pos != end) {
        return Result<bool>::failure(Error::PARSE_ERROR);
    }
    if (block != expected.size()) {
        return Result<bool>::failure(Error::INVALID_RESPONSE);
    }
    return Result<bool>::success(true);
}

} // namespace genibus
