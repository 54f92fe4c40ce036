#include "catalog_loader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace mockup {

namespace {

std::string resolvePath(const std::filesystem::path& baseDir, const std::string& p)
{
    std::filesystem::path path(p);
    if (path.is_absolute() || baseDir.empty()) return path.string();
    return (baseDir / path).lexically_normal().string();
}

bool readPositive(const nlohmann::json& j, const char* key, double& out)
{
    if (!j.contains(key)) return true;
    if (!j[key].is_number() || !(j[key].get<double>() > 0)) return false;
    out = j[key].get<double>();
    return true;
}

std::optional<MockupSettings> parseSettings(const nlohmann::json& j, MockupSettings s)
{
    if (!j.is_object()) return std::nullopt;
    if (j.contains("white_threshold"))
    {
        if (!j["white_threshold"].is_number_integer()) return std::nullopt;
        s.whiteThreshold = j["white_threshold"].get<int>();
        if (s.whiteThreshold < 0 || s.whiteThreshold > 255) return std::nullopt;
    }
    if (!readPositive(j, "dpi", s.dpi) || !readPositive(j, "ppi", s.ppi)) return std::nullopt;
    if (j.contains("margin_inch"))
    {
        // 0 is a valid margin; negative ones would grow the frame
        if (!j["margin_inch"].is_number() || !(j["margin_inch"].get<double>() >= 0)) return std::nullopt;
        s.marginInch = j["margin_inch"].get<double>();
    }
    return s;
}

std::optional<MockupConfig> parseConfig(const nlohmann::json& j, const std::filesystem::path& baseDir,
                                        const MockupSettings& defaults)
{
    if (!j.is_object()) return std::nullopt;

    MockupCatalog::Entries entries;
    for (Orientation o : {Orientation::Vertical, Orientation::Horizontal})
    {
        const char* key = toString(o);
        if (!j.contains(key)) continue;
        if (!j[key].is_array()) return std::nullopt;
        std::vector<std::string> paths;
        for (const auto& p : j[key])
        {
            if (!p.is_string()) return std::nullopt;
            paths.push_back(resolvePath(baseDir, p.get<std::string>()));
        }
        entries[o] = std::move(paths);
    }

    MockupConfig config;
    config.catalog = MockupCatalog(std::move(entries));
    config.settings = defaults;
    if (j.contains("settings"))
    {
        auto s = parseSettings(j["settings"], defaults);
        if (!s) return std::nullopt;
        config.settings = *s;
    }
    return config;
}

}

MockupCatalog defaultCatalog(const std::filesystem::path& root)
{
    MockupCatalog::Entries entries;
    entries[Orientation::Vertical] = {
        (root / "mockup_vertical_small.jpeg").string(),
        (root / "mockup_vertical_large.jpeg").string(),
    };
    entries[Orientation::Horizontal] = {
        (root / "mockup_horizontal_large.png").string(),
    };
    return MockupCatalog(std::move(entries));
}

std::optional<MockupConfig> loadConfigFromJson(std::istream& in, const std::filesystem::path& baseDir,
                                               const MockupSettings& defaults)
{
    try
    {
        nlohmann::json j = nlohmann::json::parse(in);
        return parseConfig(j, baseDir, defaults);
    }
    catch (const nlohmann::json::exception& e)
    {
        std::cerr << "[loadConfigFromJson] " << e.what() << "\n";
        return std::nullopt;
    }
}

std::optional<MockupConfig> loadConfigFromJsonFile(const std::string& path, const MockupSettings& defaults)
{
    std::ifstream f(path);
    if (!f)
    {
        std::cerr << "[loadConfigFromJsonFile] cannot open: " << path << "\n";
        return std::nullopt;
    }
    return loadConfigFromJson(f, std::filesystem::path(path).parent_path(), defaults);
}

}
