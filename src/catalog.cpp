#include "common/catalog.hpp"
#include "common/protocol.hpp"
#include <algorithm>
#include <iostream>

namespace genibus {

namespace {

using namespace Protocol::Class;

DataPoint dp(const char* name, uint8_t id, uint8_t klass, uint8_t width = 1, double scale = 1.0, bool is_signed = false)
{
    DataPoint point;
    point.name = name;
    point.id = id;
    point.klass = klass;
    point.width = width;
    point.scale = scale;
    point.is_signed = is_signed;
    return point;
}

std::vector<CatalogEntry> magna_entries()
{
    const std::string family = Protocol::DEFAULT_FAMILY;
    std::vector<DataPoint> points = {
        // Protocol data
        dp("buf_len", 2, PROTOCOL_DATA),
        dp("unit_bus_mode", 3, PROTOCOL_DATA),

        // Measured data, 8 bit
        dp("i_dc", 20, MEASURED_DATA),
        dp("v_dc", 21, MEASURED_DATA),
        dp("t_e", 22, MEASURED_DATA, 1, 1.0, true),
        dp("f_act", 32, MEASURED_DATA),
        dp("p", 34, MEASURED_DATA),
        dp("speed", 35, MEASURED_DATA),
        dp("h", 37, MEASURED_DATA),
        dp("q", 39, MEASURED_DATA),
        dp("t_w", 58, MEASURED_DATA, 1, 1.0, true),
        dp("act_mode1", 81, MEASURED_DATA),
        dp("act_mode2", 82, MEASURED_DATA),
        dp("act_mode3", 83, MEASURED_DATA),
        dp("unit_family", 148, MEASURED_DATA),
        dp("unit_type", 149, MEASURED_DATA),
        dp("unit_version", 150, MEASURED_DATA),
        dp("warn_code", 156, MEASURED_DATA),
        dp("alarm_code", 158, MEASURED_DATA),

        // Measured data, 16 bit
        dp("p", 1, SIXTEENBIT_MEASURED_DATA, 2),
        dp("speed", 2, SIXTEENBIT_MEASURED_DATA, 2),
        dp("h", 3, SIXTEENBIT_MEASURED_DATA, 2, 0.01),
        dp("q", 4, SIXTEENBIT_MEASURED_DATA, 2, 0.1),
        dp("t_w", 5, SIXTEENBIT_MEASURED_DATA, 2, 0.01, true),

        // Commands
        dp("RESET", 1, COMMANDS),
        dp("RESET_ALARM", 2, COMMANDS),
        dp("STOP", 5, COMMANDS),
        dp("START", 6, COMMANDS),
        dp("REMOTE", 7, COMMANDS),
        dp("LOCAL", 8, COMMANDS),
        dp("MIN", 25, COMMANDS),
        dp("MAX", 26, COMMANDS),

        // Configuration parameters
        dp("unit_addr", 46, CONFIGURATION_PARAMETERS),
        dp("group_addr", 47, CONFIGURATION_PARAMETERS),
        dp("min_curve_no", 254, CONFIGURATION_PARAMETERS),

        // Reference values
        dp("ref", 1, REFERENCE_VALUES),
        dp("ref_ir", 2, REFERENCE_VALUES),

        // ASCII strings
        dp("product_name", 8, ASCII_STRINGS),
        dp("serial_no", 9, ASCII_STRINGS),
    };

    std::vector<CatalogEntry> entries;
    entries.reserve(points.size());
    for (auto& point : points) {
        entries.push_back({family, std::move(point)});
    }
    return entries;
}

} // anonymous namespace

double DataPoint::decode(const uint8_t* raw) const
{
    uint32_t value = 0;
    for (uint8_t i = 0; i < width; i++) {
        value = (value << 8) | raw[i];
    }

    int64_t number = value;
    if (is_signed && width > 0) {
        uint32_t sign_bit = 1u << (width * 8 - 1);
        if (value & sign_bit) {
            number = static_cast<int64_t>(value) - (static_cast<int64_t>(sign_bit) << 1);
        }
    }
    return static_cast<double>(number) * scale;
}

Catalog::Catalog(const std::vector<CatalogEntry>& entries)
{
    for (const auto& entry : entries) {
        Key key{entry.family, entry.point.klass, entry.point.name};
        if (!points_.emplace(key, entry.point).second) {
            std::cerr << "[CATALOG] duplicate data point " << entry.family << "/"
                      << static_cast<int>(entry.point.klass) << "/" << entry.point.name << "\n";
        }
    }
}

Result<DataPoint> Catalog::lookup(const std::string& family, uint8_t klass, const std::string& name) const
{
    auto it = points_.find(Key{family, klass, name});
    if (it == points_.end()) {
        return Result<DataPoint>::failure(Error::UNKNOWN_DATA_POINT);
    }
    return Result<DataPoint>::success(it->second);
}

std::vector<DataPoint> Catalog::by_class(const std::string& family, uint8_t klass) const
{
    std::vector<DataPoint> result;
    for (const auto& [key, point] : points_) {
        if (std::get<0>(key) == family && std::get<1>(key) == klass) {
            result.push_back(point);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const DataPoint& a, const DataPoint& b) { return a.id < b.id; });
    return result;
}

std::shared_ptr<const Catalog> Catalog::builtin()
{
    return std::make_shared<const Catalog>(magna_entries());
}

} // namespace genibus
