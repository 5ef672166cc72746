#include "property-set.h"

#include <fmt/format.h>

#include <utility>

#include "errors.h"

using boost::optional;
using std::string;

PropertySet::PropertySet(container_type values) :
    values(std::move(values)) {}

bool PropertySet::contains(const string& name) const {
    return values.find(name) != values.end();
}

const Value& PropertySet::get(const string& name) const {
    const auto it = values.find(name);
    if (it == values.end()) {
        throw InvariantViolation(fmt::format("Property '{}' is not set.", name));
    }
    return it->second;
}

optional<const Value&> PropertySet::tryGet(const string& name) const {
    const auto it = values.find(name);
    if (it == values.end()) return boost::none;
    return it->second;
}

void PropertySet::set(const string& name, const Value& value) {
    values[name] = value;
}

template <typename T>
const T& PropertySet::getTyped(const string& name, ValueType expected) const {
    const Value& value = get(name);
    const T* typedValue = boost::get<T>(&value);
    if (!typedValue) {
        throw InvariantViolation(fmt::format(
            "Property '{}' holds a {} value, not a {} value.",
            name,
            ValueTypeConverter::get().toString(getValueType(value)),
            ValueTypeConverter::get().toString(expected)
        ));
    }
    return *typedValue;
}

double PropertySet::getNumber(const string& name) const {
    return getTyped<double>(name, ValueType::Number);
}

Point PropertySet::getPoint(const string& name) const {
    return getTyped<Point>(name, ValueType::Point);
}

Color PropertySet::getColor(const string& name) const {
    return getTyped<Color>(name, ValueType::Color);
}

const string& PropertySet::getText(const string& name) const {
    return getTyped<string>(name, ValueType::Text);
}

optional<Point> PropertySet::tryGetPoint(const string& name) const {
    if (!contains(name)) return boost::none;
    return getPoint(name);
}

optional<Color> PropertySet::tryGetColor(const string& name) const {
    if (!contains(name)) return boost::none;
    return getColor(name);
}
