#pragma once

#include "tools/enum-converter.h"

enum class ShapeKind {
    Circle,
    Square,
    Rectangle,
    Ellipse,
    Triangle,
    Line,
    Arrow,
    DoubleArrow,
    Vector,
    Text,
    Group
};

class ShapeKindConverter : public EnumConverter<ShapeKind> {
public:
    static ShapeKindConverter& get();

protected:
    std::string getTypeName() override;
    member_data getMemberData() override;
};

std::ostream& operator<<(std::ostream& stream, ShapeKind value);
