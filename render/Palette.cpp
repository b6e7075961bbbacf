#include "render/Palette.hpp"

namespace {
// Daylight palette.
constexpr FieldPalette kPalette{
    /* skyTop       */ Color{79, 172, 254, 255},
    /* skyBottom    */ Color{0, 242, 254, 255},
    /* obstacle     */ Color{6, 214, 160, 255},
    /* ground       */ Color{255, 209, 102, 255},
    /* groundStripe */ Color{249, 199, 79, 255},
    /* body         */ Color{255, 209, 102, 255},
    /* bodyEye      */ Color{7, 59, 76, 255},
    /* bodyBeak     */ Color{239, 71, 111, 255},
    /* uiText       */ Color{255, 255, 255, 255},
    /* uiShade      */ Color{0, 0, 0, 90},
};
} // namespace

const FieldPalette &GetPalette() { return kPalette; }
