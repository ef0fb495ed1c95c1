//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/TemplateMatcher.cpp
// Purpose: Template-to-regex compilation and anchored matching of loader text.
//
// The generated loader is reformatted between `cargo web` releases, so the
// templates are matched modulo whitespace.  Identifiers the toolchain derives
// from the crate name are written as a placeholder in the template.  Anything
// else that differs means the loader's behaviour may have changed and the
// match must fail.
//
//===----------------------------------------------------------------------===//

#include "build/TemplateMatcher.hpp"

#include <cctype>
#include <string_view>
#include <utility>

namespace screeps::build
{

namespace
{

bool isTemplateSpace(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool isRegexSpecial(char ch)
{
    constexpr std::string_view kSpecials = "\\^$.|?*+()[]{}";
    return kSpecials.find(ch) != std::string_view::npos;
}

void appendLiteral(std::vector<TemplateSegment> &out, std::string_view text)
{
    if (text.empty())
        return;
    if (!out.empty() && out.back().kind == TemplateSegment::Kind::Literal)
    {
        out.back().text.append(text);
        return;
    }
    out.push_back({TemplateSegment::Kind::Literal, std::string(text)});
}

/// @brief Split a whitespace-free run on the placeholder token.
void appendLiteralRun(std::vector<TemplateSegment> &out,
                      std::string_view run,
                      std::string_view placeholder)
{
    while (!run.empty())
    {
        const auto pos = placeholder.empty() ? std::string_view::npos : run.find(placeholder);
        if (pos == std::string_view::npos)
        {
            appendLiteral(out, run);
            return;
        }
        appendLiteral(out, run.substr(0, pos));
        out.push_back({TemplateSegment::Kind::Placeholder, std::string(placeholder)});
        run.remove_prefix(pos + placeholder.size());
    }
}

/// @brief Subject text with every whitespace run collapsed to one space.
/// @details origin[i] is the offset in the original text of condensed
///          character i; origin[text.size()] is the original length.
struct CondensedText
{
    std::string text;
    std::vector<std::size_t> origin;
};

// std::regex recurses once per character consumed, so an unbounded run of
// whitespace under `\s*` exhausts the stack.  Template literals contain no
// whitespace and whitespace segments are never adjacent, so collapsing runs
// does not change which spans match.
CondensedText condenseWhitespace(std::string_view subject)
{
    CondensedText out;
    out.text.reserve(subject.size());
    out.origin.reserve(subject.size() + 1);
    std::size_t i = 0;
    while (i < subject.size())
    {
        out.origin.push_back(i);
        if (isTemplateSpace(subject[i]))
        {
            out.text.push_back(' ');
            while (i < subject.size() && isTemplateSpace(subject[i]))
                ++i;
        }
        else
        {
            out.text.push_back(subject[i]);
            ++i;
        }
    }
    out.origin.push_back(subject.size());
    return out;
}

} // namespace

std::vector<TemplateSegment> parseTemplate(std::string_view templateText,
                                           std::string_view placeholder)
{
    std::vector<TemplateSegment> segments;
    std::size_t i = 0;
    while (i < templateText.size())
    {
        const bool space = isTemplateSpace(templateText[i]);
        std::size_t j = i;
        while (j < templateText.size() && isTemplateSpace(templateText[j]) == space)
            ++j;

        const auto run = templateText.substr(i, j - i);
        if (space)
            segments.push_back({TemplateSegment::Kind::Whitespace, std::string(run)});
        else
            appendLiteralRun(segments, run, placeholder);
        i = j;
    }
    return segments;
}

std::string segmentsToRegex(const std::vector<TemplateSegment> &segments)
{
    std::string out;
    for (const auto &seg : segments)
    {
        switch (seg.kind)
        {
            case TemplateSegment::Kind::Whitespace:
                out += "\\s*";
                break;
            case TemplateSegment::Kind::Placeholder:
                out += "[A-Za-z0-9_]+";
                break;
            case TemplateSegment::Kind::Literal:
                for (const char ch : seg.text)
                {
                    if (isRegexSpecial(ch))
                        out.push_back('\\');
                    out.push_back(ch);
                }
                break;
        }
    }
    return out;
}

TemplatePattern::TemplatePattern(std::string source, Anchor anchor)
    : source_(std::move(source)), anchor_(anchor), regex_(source_, std::regex::ECMAScript)
{
}

TemplatePattern TemplatePattern::compile(std::string_view templateText,
                                         Anchor anchor,
                                         std::string_view placeholder)
{
    std::string body = segmentsToRegex(parseTemplate(templateText, placeholder));
    if (anchor == Anchor::Start)
        return TemplatePattern("^" + body, anchor);
    return TemplatePattern(body + "$", anchor);
}

std::optional<MatchSpan> TemplatePattern::match(std::string_view subject) const
{
    const CondensedText condensed = condenseWhitespace(subject);

    std::smatch m;
    auto flags = std::regex_constants::match_default;
    if (anchor_ == Anchor::Start)
        flags |= std::regex_constants::match_continuous;

    if (!std::regex_search(condensed.text, m, regex_, flags))
        return std::nullopt;

    const auto start = static_cast<std::size_t>(m.position(0));
    const auto end = start + static_cast<std::size_t>(m.length(0));
    return MatchSpan{condensed.origin[start], condensed.origin[end]};
}

support::Expected<LoaderShape> matchLoaderShape(const TemplatePattern &prefix,
                                                const TemplatePattern &suffix,
                                                std::string_view text,
                                                const std::string &fileName)
{
    auto unexpected = [&fileName](const char *which) {
        return support::makeError(
            support::DiagCode::UnexpectedStructure,
            std::string("'cargo web' generated an unexpected JS ") + which +
                " in " + fileName +
                ". This means it has been updated without screeps-build also being "
                "updated; screeps-build needs updating before it can process this "
                "output. Please report this issue and include the first ~30 lines of " +
                fileName + ".");
    };

    auto prefixMatch = prefix.match(text);
    if (!prefixMatch)
        return unexpected("prefix");

    auto suffixMatch = suffix.match(text);
    if (!suffixMatch)
        return unexpected("suffix");

    return LoaderShape{*prefixMatch, *suffixMatch};
}

} // namespace screeps::build
