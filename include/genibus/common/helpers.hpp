#pragma once

#include <vector>
#include <string>
#include <stdint.h>
#include "common/catalog.hpp"

namespace genibus {

std::string bytesToHex(const std::vector<uint8_t>& data);
std::string formatValues(const Values& values);

} // namespace genibus
