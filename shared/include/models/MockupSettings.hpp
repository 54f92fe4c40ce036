/**
 * @file MockupSettings.hpp
 * Policy values for frame detection and compositing. The defaults are the
 * values the mockup photographs were authored for.
 */
#pragma once

namespace mockup {

struct MockupSettings
{
    // Frame detection: the blank frame interior must be brighter than this
    // (0-255 grey). Fixed per run, never estimated from the image.
    int whiteThreshold {240};

    // Resolution of the reference photographs; converts the margin to px.
    double dpi {300.0};

    // Resolution assumed for the artwork; converts its px size to inches.
    double ppi {96.0};

    // Blank border kept between the frame edge and the artwork.
    double marginInch {0.01};
};

}
