#pragma once

#include "models/MockupCatalog.hpp"
#include "models/MockupSettings.hpp"
#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace mockup {

struct MockupConfig
{
    MockupCatalog catalog;
    MockupSettings settings;
};

// Catalog shipped with the service: two vertical frames and one horizontal frame under `root`.
MockupCatalog defaultCatalog(const std::filesystem::path& root = "static/mockups");

// Reads {"vertical": [...], "horizontal": [...], "settings": {...}}. Relative mockup
// paths are resolved against `baseDir`. Settings not given keep `defaults`.
std::optional<MockupConfig> loadConfigFromJson(std::istream& in,
                                               const std::filesystem::path& baseDir = {},
                                               const MockupSettings& defaults = MockupSettings{});
std::optional<MockupConfig> loadConfigFromJsonFile(const std::string& path,
                                                   const MockupSettings& defaults = MockupSettings{});

}
