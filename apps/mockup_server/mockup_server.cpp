// HTTP front of the mockup pipeline: POST / with a multipart `file` field
// Build via CMake target: mockup_server

#include "catalog_loader/catalog_loader.hpp"
#include "http_service/http_server.hpp"
#include "http_service/mockup_service.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

int main(int argc, char** argv)
{
    mockup::http_service::ServerOptions options;
    std::string catalogPath;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--address" && i + 1 < argc) options.address = argv[++i];
            else if (arg == "--port" && i + 1 < argc) options.port = static_cast<unsigned short>(std::stoi(argv[++i]));
            else if (arg == "--catalog" && i + 1 < argc) catalogPath = argv[++i];
            else if (arg == "--timeout" && i + 1 < argc) options.ioTimeoutSeconds = std::stoi(argv[++i]);
            else
            {
                std::cerr << "Usage: " << argv[0] << " [--address 0.0.0.0] [--port 5100] [--catalog file.json] [--timeout seconds]\n";
                return 1;
            }
        }
    }
    catch (const std::logic_error&)
    {
        std::cerr << "[mockup_server] invalid numeric argument\n";
        return 1;
    }

    std::optional<mockup::MockupConfig> loaded = catalogPath.empty()
        ? std::optional<mockup::MockupConfig>(mockup::MockupConfig{mockup::defaultCatalog(), mockup::MockupSettings{}})
        : mockup::loadConfigFromJsonFile(catalogPath);
    if (!loaded) { std::cerr << "[mockup_server] cannot load catalog " << catalogPath << "\n"; return 1; }

    // Fixed from here on; the service only reads it
    const mockup::MockupConfig config = std::move(*loaded);
    if (config.catalog.empty())
    {
        std::cerr << "[mockup_server] catalog has no mockups\n";
        return 1;
    }

    mockup::http_service::MockupService service(config.catalog, config.settings);
    return mockup::http_service::runServer(options, service) ? 0 : 1;
}
