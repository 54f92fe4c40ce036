#pragma once
#include <string>
#include "models/MockupError.hpp"
#include "models/SubjectMaskSettings.hpp"
#include <opencv2/core.hpp>

namespace mockup {

// Removes the background of `image` and returns it as BGRA with alpha marking the subject.
// The removal model is external: the command from removalCommand() is run on a temporary PNG.
// When it is disabled, missing or fails, a heuristic OpenCV mask is used so the pipeline still
// works. Fails only when the image itself is unusable.
Result<cv::Mat> removeBackground(const cv::Mat& image, const SubjectMaskSettings& settings = SubjectMaskSettings{});

// Command line template for the external remover, with {input} and {output} placeholders.
// BACKGROUND_REMOVAL_CMD overrides the rembg default; set it to an empty string to disable.
std::string removalCommand();

// Compute a subject mask directly from an image (no disk I/O). Result is CV_8U {0,255},
// or softened at the edge when settings.featherRadius > 0.
bool computeSubjectMask(const cv::Mat& img, cv::Mat& outMask, const SubjectMaskSettings& settings);

}
