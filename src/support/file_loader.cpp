//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/file_loader.cpp
// Purpose: Standardise how the pipeline loads build artifacts into memory.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned string owns its buffer.
// Links: src/support/file_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "support/file_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace screeps::support
{

Expected<std::string> loadFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return makeError(DiagCode::Io, "unable to open " + path);

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    const std::streamoff fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kLimit = static_cast<std::streamoff>(kMaxLoadSize);
    if (fileSize < 0 || fileSize > kLimit)
        return makeError(DiagCode::Io, "file too large: " + path + " (limit: 256 MB)");

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            return makeError(DiagCode::Io, "error reading " + path);
        return Expected<std::string>(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return makeError(DiagCode::Io, "out of memory reading " + path);
    }
}

} // namespace screeps::support
