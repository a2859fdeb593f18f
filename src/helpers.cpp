#include "common/helpers.hpp"
#include <sstream>
#include <iomanip>

namespace genibus {

std::string bytesToHex(const std::vector<uint8_t>& data)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::string formatValues(const Values& values)
{
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [name, value] : values) {
        if (!first) {
            oss << ", ";
        }
        oss << name << "=" << value;
        first = false;
    }
    oss << "}";
    return oss.str();
}

} // namespace genibus
