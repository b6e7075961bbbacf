#pragma once

#include <raylib.h>

struct FieldPalette {
    Color skyTop{};
    Color skyBottom{};
    Color obstacle{};
    Color ground{};
    Color groundStripe{};
    Color body{};
    Color bodyEye{};
    Color bodyBeak{};
    Color uiText{};
    Color uiShade{};
};

const FieldPalette& GetPalette();
