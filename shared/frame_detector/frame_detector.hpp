/*========================  frame_detector.hpp  ========================

   Locates the blank frame inside a mockup photograph.
   --------------------------------------------------------------------
   • threshold the grey image at a fixed brightness (default 240)
   • take the external contour with the largest enclosed area
   • return its axis-aligned bounding rectangle

   Mockups must be authored with a near-white (>240) frame interior; the
   threshold is never estimated from the image.

=====================================================================*/
#pragma once
#include "models/MockupError.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace mockup {

constexpr int kDefaultWhiteThreshold = 240;

/**
 * @brief Finds the bounding box of the largest near-white region of `image`.
 *
 * @param image           Reference photograph (grey, BGR or BGRA, 8-bit).
 * @param whiteThreshold  Pixels with intensity > this value are frame candidates.
 * @param name            Identifier used in error messages (usually the path).
 * @return the frame rectangle, DetectionError when no bright region exists,
 *         IoError when `image` is empty.
 */
Result<cv::Rect> detectFrame(const cv::Mat& image,
                             int whiteThreshold = kDefaultWhiteThreshold,
                             const std::string& name = "<memory>");

// Reads `path` and runs detectFrame on it.
Result<cv::Rect> detectFrameInFile(const std::string& path,
                                   int whiteThreshold = kDefaultWhiteThreshold);

}
