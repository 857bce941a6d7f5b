#include "civcad/exchange/aci_palette.h"

namespace civcad {

int colorToAci(Rgb color) {
    const int r = rgbRed(color);
    const int g = rgbGreen(color);
    const int b = rgbBlue(color);

    if (r > 200 && g < 100 && b < 100) return 1; // red
    if (r > 200 && g > 200 && b < 100) return 2; // yellow
    if (r < 100 && g > 200 && b < 100) return 3; // green
    if (r < 100 && g > 200 && b > 200) return 4; // cyan
    if (r < 100 && g < 100 && b > 200) return 5; // blue
    if (r > 200 && g < 100 && b > 200) return 6; // magenta
    if (r > 200 && g > 200 && b > 200) return 7; // white
    if (r < 100 && g < 100 && b < 100) return 0; // black
    if (r > 100 && g > 100 && b > 100) return 8; // grey
    return 7;
}

Rgb aciToColor(int aci) {
    static constexpr Rgb kTable[] = {
        0x000000, 0xFF0000, 0xFFFF00, 0x00FF00, 0x00FFFF,
        0x0000FF, 0xFF00FF, 0xFFFFFF, 0x808080, 0xC0C0C0,
    };
    if (aci < 0 || aci >= static_cast<int>(sizeof(kTable) / sizeof(kTable[0]))) return 0x000000;
    return kTable[aci];
}

} // namespace civcad
