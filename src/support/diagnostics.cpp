/**
 * @file diagnostics.cpp
 * @brief Implements diagnostic formatting shared by the pipeline and the CLI.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     Diagnostics are printed one per line as `<severity>: <message>`.
 */

#include "diagnostics.hpp"

namespace screeps::support
{
/**
 * @brief Map a diagnostic severity to the lowercase word used when printing.
 */
const char *severityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}

/**
 * @brief Writes @p diag to @p os followed by a newline.
 *
 * The message is emitted verbatim; multi-line messages keep their embedded
 * newlines so long advisories stay readable.
 */
void printDiag(const Diagnostic &diag, std::ostream &os)
{
    os << severityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace screeps::support
