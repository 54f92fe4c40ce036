#pragma once
#include "models/MockupError.hpp"
#include <opencv2/core.hpp>

namespace mockup {

/**
 * @brief Places `foreground` inside `frame` of `mockup` and returns the whole
 *        mockup canvas (BGRA, same size as `mockup`).
 *
 * The frame is shrunk by floor(marginInch * dpi) px on every side. The
 * foreground is shrunk (never enlarged) to fit the remaining box, centred in
 * it and blended through its own alpha channel.
 *
 * @return the composite, MarginError when the margin is negative, not finite
 *         or leaves no room, ConfigurationError for a non-positive dpi,
 *         InputError when either image is empty.
 */
Result<cv::Mat> compositeIntoFrame(const cv::Mat& mockup,
                                   const cv::Rect& frame,
                                   const cv::Mat& foreground,
                                   double marginInch,
                                   double dpi);

// Margin in px for `marginInch` on a `dpi` photograph, floored. Kept in double
// so oversized margins are compared before any int conversion.
double marginPixels(double marginInch, double dpi);

}
