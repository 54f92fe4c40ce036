/*========================  mockup_pipeline.hpp  ========================

   One mockup job from a background-free artwork to the final composite.
   --------------------------------------------------------------------
   • orientation from the artwork's size in inches
   • best-fitting mockup for that orientation
   • artwork composited into the mockup's frame

   Shared by the CLI and the HTTP service. A progress line is written before
   each stage so a failing job still shows how far it got.

=====================================================================*/
#pragma once
#include "mockup_selector/mockup_selector.hpp"
#include "models/MockupCatalog.hpp"
#include "models/MockupError.hpp"
#include "models/MockupSettings.hpp"
#include "models/Orientation.hpp"

#include <opencv2/core.hpp>
#include <ostream>

namespace mockup {

struct MockupResult
{
    cv::Mat image;            // BGRA, size of the chosen mockup
    MockupMatch match;
    Orientation orientation {Orientation::Vertical};
    cv::Size artworkPx;
    double widthIn {0.0};
    double heightIn {0.0};
};

Result<MockupResult> runMockupPipeline(const MockupCatalog& catalog,
                                       const cv::Mat& foreground,
                                       const MockupSettings& settings,
                                       std::ostream& progress,
                                       const ImageLoader& loader = ImageLoader{});

}
