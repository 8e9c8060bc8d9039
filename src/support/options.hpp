//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings that influence registry construction.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values; the trace stream is borrowed.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/trace.hpp"

namespace pymagic::support
{

/// @brief Holds settings that control how the catalog is loaded.
/// @invariant Flags are independent.
/// @ownership Value type.
struct Options
{
    /// @brief Tracing of catalog loading and table publication.
    TraceConfig trace{};

    /// @brief Load catalog entries for PyPy, Jython, Pyston, Graal and Dropbox.
    bool includeAlternateImplementations = true;
};
} // namespace pymagic::support
