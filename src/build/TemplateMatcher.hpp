//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/TemplateMatcher.hpp
// Purpose: Compile whitespace-tolerant patterns from literal template text and
//          locate them at the start or end of generated loader scripts.
// Key invariants: Whitespace runs match zero or more whitespace characters;
//                 the placeholder matches one or more [A-Za-z0-9_]; every other
//                 character must match exactly.
// Ownership/Lifetime: TemplatePattern owns its compiled std::regex.
// Links: build/ToolchainContract.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace screeps::build
{

/// @brief One piece of a parsed template.
struct TemplateSegment
{
    enum class Kind
    {
        Literal,     ///< Characters matched exactly.
        Whitespace,  ///< A run of whitespace; matches zero or more whitespace characters.
        Placeholder  ///< The sentinel token; matches one or more identifier characters.
    };

    Kind kind;
    std::string text; ///< Original template text covered by the segment.
};

/// @brief Which end of the subject a pattern is pinned to.
enum class Anchor
{
    Start,
    End
};

/// @brief Half-open byte range [start, end) of a match within the subject.
struct MatchSpan
{
    std::size_t start = 0;
    std::size_t end = 0;
};

/// @brief Split @p templateText into literal, whitespace and placeholder segments.
/// @param placeholder Sentinel token recognised inside literal runs.
std::vector<TemplateSegment> parseTemplate(std::string_view templateText,
                                           std::string_view placeholder);

/// @brief Translate parsed segments into an unanchored ECMAScript regex body.
std::string segmentsToRegex(const std::vector<TemplateSegment> &segments);

/// @brief An anchored, compiled template.
class TemplatePattern
{
  public:
    /// @brief Compile @p templateText into a pattern pinned to @p anchor.
    static TemplatePattern compile(std::string_view templateText,
                                   Anchor anchor,
                                   std::string_view placeholder);

    /// @brief Locate the pattern in @p subject.
    /// @return The single anchored match, or std::nullopt when the subject
    ///         does not have the expected shape at that end.
    std::optional<MatchSpan> match(std::string_view subject) const;

    /// @brief Regex source the pattern was compiled from, including anchors.
    const std::string &source() const
    {
        return source_;
    }

  private:
    TemplatePattern(std::string source, Anchor anchor);

    std::string source_;
    Anchor anchor_;
    std::regex regex_;
};

/// @brief Matched prefix and suffix of a loader script.
struct LoaderShape
{
    MatchSpan prefix;
    MatchSpan suffix;
};

/// @brief Require both anchored patterns to match @p text.
/// @param fileName Path reported in the diagnostic.
/// @return Both spans, or a DiagCode::UnexpectedStructure diagnostic that names
///         the file and the end that failed to match.
support::Expected<LoaderShape> matchLoaderShape(const TemplatePattern &prefix,
                                                const TemplatePattern &suffix,
                                                std::string_view text,
                                                const std::string &fileName);

} // namespace screeps::build
