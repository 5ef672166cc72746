#pragma once

#include <boost/optional.hpp>
#include <map>
#include <string>

#include "value.h"

// The typed properties of one object. Values have already been checked against the object's
// schema, so a failing typed accessor indicates a broken invariant.
class PropertySet {
public:
    using container_type = std::map<std::string, Value>;
    using const_iterator = container_type::const_iterator;

    PropertySet() = default;
    explicit PropertySet(container_type values);

    bool contains(const std::string& name) const;
    const Value& get(const std::string& name) const;
    boost::optional<const Value&> tryGet(const std::string& name) const;
    void set(const std::string& name, const Value& value);

    double getNumber(const std::string& name) const;
    Point getPoint(const std::string& name) const;
    Color getColor(const std::string& name) const;
    const std::string& getText(const std::string& name) const;

    boost::optional<Point> tryGetPoint(const std::string& name) const;
    boost::optional<Color> tryGetColor(const std::string& name) const;

    size_t size() const {
        return values.size();
    }
    const_iterator begin() const {
        return values.begin();
    }
    const_iterator end() const {
        return values.end();
    }

    bool operator==(const PropertySet& rhs) const {
        return values == rhs.values;
    }
    bool operator!=(const PropertySet& rhs) const {
        return !operator==(rhs);
    }

private:
    template <typename T>
    const T& getTyped(const std::string& name, ValueType expected) const;

    container_type values;
};
