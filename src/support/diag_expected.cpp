//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library: the Expected<void> specialization, severity-to-string mapping, and
// the printer shared by DiagnosticEngine and callers holding a single Diag.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "diag_expected.hpp"

namespace pymagic::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @details A default-constructed `Expected` contains no diagnostic payload and
///          represents success.
///
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

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
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
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

/// @brief Build an error diagnostic with the provided code and message.
Diag makeError(std::string code, std::string msg)
{
    return Diag{Severity::Error, std::move(code), std::move(msg)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details The code, when present, is printed between the severity and the
///          message so that log scrapers can match on it.  A trailing newline
///          is always emitted so multiple diagnostics form a contiguous block.
void printDiag(const Diag &diag, std::ostream &os)
{
    os << detail::diagSeverityToString(diag.severity) << ": ";
    if (!diag.code.empty())
        os << diag.code << ": ";
    os << diag.message << '\n';
}
} // namespace pymagic::support
