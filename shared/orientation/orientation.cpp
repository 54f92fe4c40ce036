#include "orientation.hpp"

namespace mockup {

double toInches(int px, double ppi)
{
    return static_cast<double>(px) / ppi;
}

Orientation classifyOrientation(int widthPx, int heightPx, double ppi)
{
    const double widthIn = toInches(widthPx, ppi);
    const double heightIn = toInches(heightPx, ppi);
    return heightIn >= widthIn ? Orientation::Vertical : Orientation::Horizontal;
}

}
