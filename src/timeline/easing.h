#pragma once

#include "tools/enum-converter.h"

enum class Easing { Linear, EaseIn, EaseOut, EaseInOut };

class EasingConverter : public EnumConverter<Easing> {
public:
    static EasingConverter& get();

protected:
    std::string getTypeName() override;
    member_data getMemberData() override;
};

std::ostream& operator<<(std::ostream& stream, Easing value);

// Maps linear progress in [0, 1] to eased progress. Every easing maps 0 to 0 and 1 to 1.
double applyEasing(Easing easing, double progress);
