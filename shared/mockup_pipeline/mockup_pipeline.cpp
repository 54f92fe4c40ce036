#include "mockup_pipeline.hpp"
#include "compositor/compositor.hpp"
#include "orientation/orientation.hpp"

#include <iomanip>
#include <sstream>

namespace mockup {

Result<MockupResult> runMockupPipeline(const MockupCatalog& catalog, const cv::Mat& foreground,
                                       const MockupSettings& settings, std::ostream& progress,
                                       const ImageLoader& loader)
{
    if (foreground.empty())
        return MockupError(ErrorKind::Input, "Foreground image is empty");
    if (!(settings.ppi > 0.0))
        return MockupError(ErrorKind::Configuration, "PPI must be positive");

    MockupResult out;
    out.artworkPx = foreground.size();
    out.widthIn = toInches(foreground.cols, settings.ppi);
    out.heightIn = toInches(foreground.rows, settings.ppi);
    std::ostringstream size;
    size << std::fixed << std::setprecision(2) << out.widthIn << " x " << out.heightIn;
    progress << "Foreground size: " << foreground.cols << "x" << foreground.rows << " px ("
             << size.str() << " in @ " << settings.ppi << " ppi)" << std::endl;

    out.orientation = classifyOrientation(foreground.cols, foreground.rows, settings.ppi);
    progress << "Orientation: " << toString(out.orientation) << std::endl;

    const ImageLoader load = loader ? loader : fileImageLoader();
    Result<MockupMatch> match = selectMockup(catalog, out.orientation, out.widthIn, out.heightIn, settings, load);
    if (!match) return match.error();
    out.match = match.value();

    const cv::Rect& f = out.match.frame;
    progress << "Frame: x=" << f.x << " y=" << f.y << " w=" << f.width << " h=" << f.height << std::endl;
    progress << "Mockup: " << out.match.mockupPath << std::endl;

    cv::Mat mockupImg = load(out.match.mockupPath);
    if (mockupImg.empty())
        return MockupError(ErrorKind::Io, "Cannot read image " + out.match.mockupPath);

    progress << "Compositing with " << settings.marginInch << " in margin @ " << settings.dpi << " dpi" << std::endl;
    Result<cv::Mat> composite = compositeIntoFrame(mockupImg, f, foreground, settings.marginInch, settings.dpi);
    if (!composite) return composite.error();
    out.image = composite.value();
    return out;
}

}
