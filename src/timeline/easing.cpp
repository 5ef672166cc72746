#include "easing.h"

#include <stdexcept>

using std::string;

EasingConverter& EasingConverter::get() {
    static EasingConverter converter;
    return converter;
}

string EasingConverter::getTypeName() {
    return "Easing";
}

EnumConverter<Easing>::member_data EasingConverter::getMemberData() {
    return member_data{
        {Easing::Linear, "linear"},
        {Easing::EaseIn, "ease_in"},
        {Easing::EaseOut, "ease_out"},
        {Easing::EaseInOut, "ease_in_out"}
    };
}

std::ostream& operator<<(std::ostream& stream, Easing value) {
    return EasingConverter::get().write(stream, value);
}

double applyEasing(Easing easing, double progress) {
    const double p = progress;
    switch (easing) {
        case Easing::Linear:
            return p;
        case Easing::EaseIn:
            return p * p;
        case Easing::EaseOut:
            return p * (2 - p);
        case Easing::EaseInOut:
            // Smoothstep
            return p * p * (3 - 2 * p);
    }
    throw std::invalid_argument("Unsupported easing.");
}
