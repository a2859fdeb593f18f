#pragma once

#include "common/types.hpp"
#include <stdint.h>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

namespace genibus {

// Decoded values keyed by data point name
using Values = std::map<std::string, double>;

struct DataPoint
{
    std::string name;
    uint8_t id = 0;
    uint8_t klass = 0;
    uint8_t width = 1;      // bytes on the wire, big endian
    double scale = 1.0;
    bool is_signed = false;

    // raw must hold width bytes
    double decode(const uint8_t* raw) const;
};

struct CatalogEntry
{
    std::string family;
    DataPoint point;
};

// Read-only lookup from symbolic data point names to GENIBus ids.
// Built once and shared between codec and engine without locking.
class Catalog
{
public:
    explicit Catalog(const std::vector<CatalogEntry>& entries);

    Result<DataPoint> lookup(const std::string& family, uint8_t klass, const std::string& name) const;
    std::vector<DataPoint> by_class(const std::string& family, uint8_t klass) const;
    size_t size() const { return points_.size(); }

    // Builds the MAGNA / CU300 table shipped with the library. Callers build
    // it once and hand the pointer to every component that needs it.
    static std::shared_ptr<const Catalog> builtin();

private:
    using Key = std::tuple<std::string, uint8_t, std::string>;
    std::map<Key, DataPoint> points_;
};

} // namespace genibus
