#pragma once

#include "value.h"

struct Camera {
    int width = 1920;
    int height = 1080;
    Color backgroundColor = Color(0, 0, 0);
};
