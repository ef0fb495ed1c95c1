//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/project_loader.cpp
// Purpose: Project root checks and the line-oriented screeps.project manifest.
//
//===----------------------------------------------------------------------===//

#include "tools/common/project_loader.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace screeps::tools::common
{

namespace
{

support::Diag makeErr(const std::string &msg)
{
    return support::makeError(support::DiagCode::Config, msg);
}

/// @brief Make a diagnostic error with file:line context.
support::Diag makeManifestErr(const std::string &path, int line, const std::string &msg)
{
    return makeErr(path + ":" + std::to_string(line) + ": " + msg);
}

/// @brief Parse an on/off boolean value.
support::Expected<bool> parseBool(const std::string &val,
                                  const std::string &manifestPath,
                                  int line,
                                  const std::string &directive)
{
    if (val == "on" || val == "true" || val == "yes")
        return true;
    if (val == "off" || val == "false" || val == "no")
        return false;
    return makeManifestErr(manifestPath, line,
                           "invalid value '" + val + "' for " + directive + "; expected on or off");
}

} // anonymous namespace

support::Expected<build::BuildConfig> parseManifest(const std::string &manifestPath,
                                                    build::BuildConfig config)
{
    std::ifstream file(manifestPath);
    if (!file.is_open())
        return makeErr("cannot open manifest: " + manifestPath);

    bool hasCargo = false;
    bool hasRelease = false;

    std::string line;
    int lineNum = 0;
    while (std::getline(file, line))
    {
        ++lineNum;

        // Strip leading/trailing whitespace
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos)
            continue; // blank line
        line = line.substr(start);
        auto end = line.find_last_not_of(" \t\r\n");
        if (end != std::string::npos)
            line = line.substr(0, end + 1);

        if (line[0] == '#')
            continue;

        auto spacePos = line.find_first_of(" \t");
        if (spacePos == std::string::npos)
            return makeManifestErr(manifestPath, lineNum, "directive missing value: '" + line + "'");

        std::string directive = line.substr(0, spacePos);
        std::string value = line.substr(line.find_first_not_of(" \t", spacePos));

        if (directive == "cargo")
        {
            if (hasCargo)
                return makeManifestErr(manifestPath, lineNum, "duplicate directive 'cargo'");
            hasCargo = true;
            config.cargo = value;
        }
        else if (directive == "release")
        {
            if (hasRelease)
                return makeManifestErr(manifestPath, lineNum, "duplicate directive 'release'");
            hasRelease = true;
            auto b = parseBool(value, manifestPath, lineNum, "release");
            if (!b)
                return b.error();
            config.release = b.value();
        }
        else
        {
            return makeManifestErr(manifestPath, lineNum, "unknown directive '" + directive + "'");
        }
    }

    return config;
}

support::Expected<build::BuildConfig> resolveProject(const std::string &root)
{
    std::error_code ec;
    fs::path dir = root.empty() ? fs::current_path(ec) : fs::path(root);
    if (ec || !fs::is_directory(dir, ec))
        return makeErr("project root is not a directory: " + (root.empty() ? "." : root));

    build::BuildConfig config;
    config.rootDir = fs::canonical(dir, ec);
    if (ec)
        return makeErr("cannot resolve project root " + dir.string() + ": " + ec.message());

    const fs::path manifest = config.rootDir / kManifestName;
    if (fs::exists(manifest, ec))
        return parseManifest(manifest.string(), std::move(config));
    return config;
}

} // namespace screeps::tools::common
