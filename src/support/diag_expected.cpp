//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the MIR
// libraries: the Expected<void> specialization, severity naming and the
// single-diagnostic printer shared by the engine and the pass manager.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace mir::support
{

/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must ensure the `Expected` represents an error first.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
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
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

Diag makeError(std::string msg)
{
    return Diag{Severity::Error, std::move(msg), SourceLoc{}};
}

/// @brief Print a diagnostic to the provided output stream.
/// @details A trailing newline is always emitted so multiple diagnostics
///          appear as a contiguous block.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (diag.loc.isValid())
    {
        os << "file#" << diag.loc.file_id;
        if (diag.loc.hasLine())
        {
            os << ':' << diag.loc.line;
            if (diag.loc.hasColumn())
                os << ':' << diag.loc.column;
        }
        os << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace mir::support
