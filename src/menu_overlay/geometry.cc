//
// Created by igor on 14/10/2026.
//

#include <menu_overlay/geometry.hh>
#include <cmath>

namespace menu_overlay {

int round_half_up(double value) {
    return static_cast<int>(std::floor(value + 0.5));
}

int pt_to_px(double pt, int dpi) {
    return round_half_up(pt * static_cast<double>(dpi) / 72.0);
}

double px_to_pt(double px, int dpi) {
    return px * 72.0 / static_cast<double>(dpi);
}

} // namespace menu_overlay
