//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/ArtifactLocator.cpp
// Purpose: Directory scan and exactly-one-per-category resolution of build outputs.
//
// `cargo web` is expected to emit one artifact pair per invocation.  Any other
// count points at a misconfigured multi-target build, so the scan reports it
// instead of picking a file.
//
//===----------------------------------------------------------------------===//

#include "build/ArtifactLocator.hpp"

#include "build/ToolchainContract.hpp"
#include "support/logger.hpp"

#include <algorithm>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace screeps::build
{

const char *artifactKindName(ArtifactKind kind)
{
    switch (kind)
    {
        case ArtifactKind::BinaryModule:
            return "wasm";
        case ArtifactKind::LoaderScript:
            return "js";
        case ArtifactKind::Ignored:
            return "ignored";
    }
    return "";
}

ExtensionMap defaultExtensionMap()
{
    return {
        {std::string(contract::kBinaryModuleExtension), ArtifactKind::BinaryModule},
        {std::string(contract::kLoaderScriptExtension), ArtifactKind::LoaderScript},
    };
}

support::Expected<std::vector<CandidateFile>> classifyDirectory(const fs::path &dir,
                                                                const ExtensionMap &extensions)
{
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        return support::makeError(support::DiagCode::Io,
                                  "cannot read directory " + dir.string() + ": " + ec.message());
    }

    std::vector<CandidateFile> files;
    for (; !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc))
            continue;

        CandidateFile file;
        file.path = it->path();
        auto found = extensions.find(file.path.extension().string());
        if (found != extensions.end())
            file.kind = found->second;
        files.push_back(std::move(file));
    }
    if (ec)
    {
        return support::makeError(support::DiagCode::Io,
                                  "error while reading directory " + dir.string() + ": " +
                                      ec.message());
    }

    std::sort(files.begin(),
              files.end(),
              [](const CandidateFile &a, const CandidateFile &b) { return a.path < b.path; });
    return files;
}

support::Expected<ArtifactSet> scanArtifacts(const fs::path &dir,
                                             const ExtensionMap &extensions,
                                             support::Logger *log)
{
    std::set<ArtifactKind> required;
    for (const auto &entry : extensions)
    {
        if (entry.second != ArtifactKind::Ignored)
            required.insert(entry.second);
    }

    auto missing = [&dir](ArtifactKind kind) {
        return support::makeError(support::DiagCode::MissingArtifact,
                                  std::string("no ") + artifactKindName(kind) +
                                      " files found in " + dir.string());
    };

    std::error_code ec;
    if (!fs::is_directory(dir, ec))
    {
        // Nothing was written, so the first required artifact is what's missing.
        if (required.empty())
            return ArtifactSet{};
        return missing(*required.begin());
    }

    auto candidates = classifyDirectory(dir, extensions);
    if (!candidates)
        return candidates.error();

    std::map<ArtifactKind, std::vector<fs::path>> byKind;
    for (const auto &file : candidates.value())
    {
        if (file.kind == ArtifactKind::Ignored)
        {
            if (log)
                log->note("ignoring " + file.path.string());
            continue;
        }
        byKind[file.kind].push_back(file.path);
    }

    ArtifactSet found;
    for (const ArtifactKind kind : required)
    {
        const auto &paths = byKind[kind];
        if (paths.empty())
            return missing(kind);
        if (paths.size() > 1)
        {
            std::string msg = std::string("multiple ") + artifactKindName(kind) +
                              " files found in " + dir.string() + ":";
            for (const auto &p : paths)
                msg += " " + p.filename().string();
            return support::makeError(support::DiagCode::AmbiguousArtifact, msg);
        }
        found.emplace(kind, paths.front());
    }
    return found;
}

} // namespace screeps::build
