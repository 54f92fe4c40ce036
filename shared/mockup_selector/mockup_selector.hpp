/*========================  mockup_selector.hpp  ========================

   Picks the mockup photograph whose frame best fits the artwork.
   --------------------------------------------------------------------
   • candidates come from the catalog entry for the orientation
   • every candidate is detected afresh; nothing is cached
   • smallest |frame ratio - art ratio| wins, earliest entry on a tie
   • the first failing candidate aborts the selection

=====================================================================*/
#pragma once
#include "models/MockupCatalog.hpp"
#include "models/MockupError.hpp"
#include "models/MockupSettings.hpp"
#include "models/Orientation.hpp"

#include <opencv2/core.hpp>
#include <functional>
#include <string>

namespace mockup {

struct MockupMatch
{
    std::string mockupPath;
    cv::Rect frame;
};

// Loads a mockup photograph by catalog path. An empty Mat means failure.
using ImageLoader = std::function<cv::Mat(const std::string&)>;

// imread with IMREAD_UNCHANGED; empty Mat on failure.
ImageLoader fileImageLoader();

/**
 * @brief Selects the catalog mockup for `orientation` whose frame aspect ratio
 *        is closest to artWidth / artHeight.
 *
 * @param catalog      Process-wide mockup catalog.
 * @param orientation  Artwork orientation; picks the candidate list.
 * @param artWidth     Artwork width, any unit (only the ratio matters).
 * @param artHeight    Artwork height, same unit as artWidth.
 * @param settings     Supplies the frame detection threshold.
 * @param loader       Photograph loader; fileImageLoader() when empty.
 * @return the best match, or ConfigurationError / InputError / the first
 *         candidate's DetectionError or IoError.
 */
Result<MockupMatch> selectMockup(const MockupCatalog& catalog,
                                 Orientation orientation,
                                 double artWidth,
                                 double artHeight,
                                 const MockupSettings& settings = MockupSettings{},
                                 const ImageLoader& loader = ImageLoader{});

}
