/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The engine aggregates messages emitted while the registry catalog is
 *     loaded and keeps per-severity counts.  Diagnostics are stored until the
 *     caller prints or inspects them.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"

#include <utility>

namespace pymagic::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    switch (d.severity)
    {
        case Severity::Error:
            ++errors_;
            break;
        case Severity::Warning:
            ++warnings_;
            break;
        case Severity::Note:
            ++notes_;
            break;
    }
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so that diagnostics returned through
 * `Expected` values and diagnostics collected here look identical.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

const std::vector<Diagnostic> &DiagnosticEngine::diagnostics() const
{
    return diags_;
}

/**
 * @brief Returns the number of error-severity diagnostics recorded so far.
 */
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

/**
 * @brief Returns the number of warning-severity diagnostics recorded so far.
 */
size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

size_t DiagnosticEngine::noteCount() const
{
    return notes_;
}
} // namespace pymagic::support
