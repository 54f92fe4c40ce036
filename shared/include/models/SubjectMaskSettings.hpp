/**
 * @file SubjectMaskSettings.hpp
 * Parameters of the heuristic subject mask used when no external background
 * removal tool is available.
 */
#pragma once

namespace mockup {

struct SubjectMaskSettings
{
    // Edge detection
    int cannyLow {40};
    int cannyHigh {120};

    // Morphology
    int morphKernel {5};     // odd size (3,5,7,...)
    int closeIters {2};

    // Paper/wall assistance: pixels brighter than this count as background
    bool usePaperAssist {true};
    int paperThreshold {-1}; // -1 = sample from the top/bottom edges

    // Post-process
    int minArea {2000};      // drop components smaller than this (px)
    int featherRadius {1};   // soften the alpha edge; 0 = hard edge
};

}
