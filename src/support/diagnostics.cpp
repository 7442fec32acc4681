/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     MIT License. See the LICENSE file in the project root for full terms.
 * @details
 *     Passes report notes (skipped call sites, rejected loops) and warnings
 *     (profile decisions that could not be applied) here.  The pass manager
 *     folds the warnings into the pipeline report.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"

namespace mir::support
{

/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::note(std::string message)
{
    report(Diagnostic{Severity::Note, std::move(message), {}});
}

void DiagnosticEngine::warn(std::string message)
{
    report(Diagnostic{Severity::Warning, std::move(message), {}});
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so every diagnostic reads the same
 * regardless of where it was produced.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

void DiagnosticEngine::clear()
{
    diags_.clear();
    errors_ = 0;
    warnings_ = 0;
}

} // namespace mir::support
