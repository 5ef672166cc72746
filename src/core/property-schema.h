#pragma once

#include <boost/optional.hpp>
#include <map>
#include <string>

#include "shape-kind.h"
#include "value.h"

struct PropertySpec {
    ValueType type;
    // Properties without a default are absent unless declared
    boost::optional<Value> defaultValue;
};

// The properties each shape kind accepts. Built once, read-only afterwards.
class PropertySchema {
public:
    static const PropertySchema& get(ShapeKind shapeKind);

    explicit PropertySchema(std::map<std::string, PropertySpec> properties);

    const PropertySpec* find(const std::string& propertyName) const;
    const std::map<std::string, PropertySpec>& getProperties() const {
        return properties;
    }

private:
    std::map<std::string, PropertySpec> properties;
};
