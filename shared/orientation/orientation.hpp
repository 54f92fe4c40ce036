#pragma once
#include "models/Orientation.hpp"

namespace mockup {

// Physical length of `px` pixels at `ppi`.
double toInches(int px, double ppi);

// Vertical when the artwork is at least as tall as it is wide; a square
// artwork is Vertical.
Orientation classifyOrientation(int widthPx, int heightPx, double ppi);

}
