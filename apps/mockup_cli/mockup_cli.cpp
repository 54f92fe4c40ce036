// Command-line front of the mockup pipeline
// Build via CMake target: mockup_cli

#include "catalog_loader/catalog_loader.hpp"
#include "mockup_pipeline/mockup_pipeline.hpp"
#include "util/ImageOps.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " <foreground.png> <output> [--catalog file.json] [--margin inch] [--ppi n]\n";
}

int fail(const mockup::MockupError& err)
{
    std::cerr << "[mockup_cli] " << mockup::toString(err.kind) << ": " << err.message << "\n";
    return 1;
}

}

int main(int argc, char** argv)
{
    std::vector<std::string> positional;
    std::string catalogPath;
    std::optional<double> marginArg;
    double ppiArg = -1.0;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--catalog" && i + 1 < argc) catalogPath = argv[++i];
            else if (arg == "--margin" && i + 1 < argc) marginArg = std::stod(argv[++i]);
            else if (arg == "--ppi" && i + 1 < argc) ppiArg = std::stod(argv[++i]);
            else if (arg == "-h" || arg == "--help") { printUsage(argv[0]); return 0; }
            else if (arg.rfind("--", 0) == 0) { printUsage(argv[0]); return 1; }
            else positional.push_back(arg);
        }
    }
    catch (const std::logic_error&)
    {
        printUsage(argv[0]);
        return 1;
    }
    if (positional.size() != 2)
    {
        printUsage(argv[0]);
        return 1;
    }
    const std::string& inP = positional[0];
    const std::string& outP = positional[1];

    mockup::MockupConfig config{mockup::defaultCatalog(), mockup::MockupSettings{}};
    if (!catalogPath.empty())
    {
        auto loaded = mockup::loadConfigFromJsonFile(catalogPath);
        if (!loaded)
            return fail({mockup::ErrorKind::Configuration, "Cannot load catalog " + catalogPath});
        config = *loaded;
    }
    if (marginArg) config.settings.marginInch = *marginArg;
    if (ppiArg > 0.0) config.settings.ppi = ppiArg;

    std::cout << "Loading foreground " << inP << std::endl;
    cv::Mat fg;
    if (!util::readImage(inP, fg, cv::IMREAD_UNCHANGED))
        return fail({mockup::ErrorKind::Io, "Cannot open input " + inP});
    if (fg.channels() != 4)
        std::cerr << "[mockup_cli] " << inP << " has no alpha channel; compositing it opaque\n";

    auto result = mockup::runMockupPipeline(config.catalog, fg, config.settings, std::cout);
    if (!result) return fail(result.error());

    if (!util::writeImage(outP, result.value().image))
        return fail({mockup::ErrorKind::Io, "Cannot write " + outP});
    std::cout << "Saved to " << outP << "\n";
    return 0;
}
