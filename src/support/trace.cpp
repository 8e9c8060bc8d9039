//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/trace.cpp
// Purpose: Implement deterministic tracing for registry construction.
// Key invariants: Each event produces at most one line; emission honours
//                 @ref TraceConfig::mode.
// Ownership/Lifetime: Sinks emit to externally owned streams.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the registry build tracing facilities.
/// @details Every line starts with "[pymagic]" so traces interleaved with
///          host program output remain greppable.  Summary mode reports table
///          publication only; Verbose mode also reports each catalog entry.

#include "support/trace.hpp"

#include "support/diagnostics.hpp"

#include <iostream>

namespace pymagic::support
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::stream() const
{
    return cfg.out ? *cfg.out : std::cerr;
}

void TraceSink::onMagic(int magicInt, std::string_view version)
{
    if (cfg.mode != TraceConfig::Verbose)
        return;
    stream() << "[pymagic] magic " << magicInt << " -> " << version << '\n';
}

void TraceSink::onAlias(std::string_view raw, std::string_view target)
{
    if (cfg.mode != TraceConfig::Verbose)
        return;
    stream() << "[pymagic] alias " << raw << " -> " << target << '\n';
}

void TraceSink::onEdit(std::string_view version, std::string_view edit)
{
    if (cfg.mode != TraceConfig::Verbose)
        return;
    stream() << "[pymagic]   " << version << ": " << edit << '\n';
}

/// @brief Emit the publication line for a table.
/// @details Root tables have no parent and are printed as "(root)".
void TraceSink::onTablePublished(std::string_view version,
                                 std::string_view parent,
                                 size_t edits,
                                 size_t opcodes)
{
    if (!cfg.enabled())
        return;
    auto &os = stream();
    os << "[pymagic] table " << version << " <- ";
    if (parent.empty())
        os << "(root)";
    else
        os << parent;
    os << " (edits=" << edits << ", opcodes=" << opcodes << ")\n";
}

void TraceSink::onTableRejected(std::string_view version, const Diagnostic &diag)
{
    if (!cfg.enabled())
        return;
    stream() << "[pymagic] table " << version << " rejected: " << diag.message << '\n';
}

void TraceSink::note(std::string_view text)
{
    if (!cfg.enabled())
        return;
    stream() << "[pymagic] " << text << '\n';
}

} // namespace pymagic::support
