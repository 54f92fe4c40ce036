#include "mockup_selector.hpp"
#include "frame_detector/frame_detector.hpp"
#include "util/ImageOps.hpp"

#include <cmath>
#include <limits>

namespace mockup {

ImageLoader fileImageLoader()
{
    return [](const std::string& path) {
        cv::Mat img;
        util::readImage(path, img, cv::IMREAD_UNCHANGED);
        return img;
    };
}

Result<MockupMatch> selectMockup(const MockupCatalog& catalog, Orientation orientation,
                                 double artWidth, double artHeight,
                                 const MockupSettings& settings, const ImageLoader& loader)
{
    const auto& candidates = catalog.candidates(orientation);
    if (candidates.empty())
        return MockupError(ErrorKind::Configuration,
                           std::string("No mockups available for orientation '") + toString(orientation) + "'");
    if (!(artWidth > 0.0) || !(artHeight > 0.0))
        return MockupError(ErrorKind::Input, "Artwork dimensions must be positive");

    const ImageLoader load = loader ? loader : fileImageLoader();
    const double artRatio = artWidth / artHeight;

    bool found = false;
    MockupMatch best;
    double smallestDiff = std::numeric_limits<double>::infinity();

    for (const auto& path : candidates)
    {
        cv::Mat img = load(path);
        if (img.empty())
            return MockupError(ErrorKind::Io, "Cannot read image " + path);

        Result<cv::Rect> frame = detectFrame(img, settings.whiteThreshold, path);
        if (!frame) return frame.error();

        const cv::Rect& r = frame.value();
        double frameRatio = static_cast<double>(r.width) / r.height;
        double diff = std::abs(frameRatio - artRatio);
        if (diff < smallestDiff)
        {
            best = MockupMatch{path, r};
            smallestDiff = diff;
            found = true;
        }
    }

    if (!found)
        return MockupError(ErrorKind::NoMatch, "No suitable mockup found.");
    return best;
}

}
