// File: src/support/trace.hpp
// Purpose: Declare tracing configuration and sink for registry construction.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value and borrows the stream.
// Links: docs/codemap.md
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace pymagic::support
{
struct Diagnostic;

/// @brief Configuration for registry build tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,     ///< Tracing disabled
        Summary, ///< One line per published or rejected table
        Verbose  ///< Additionally trace every magic, alias and edit
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    /// @return True if mode is not Off.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record a magic number bound to @p version.
    void onMagic(int magicInt, std::string_view version);

    /// @brief Record alias @p raw resolving to canonical @p target.
    void onAlias(std::string_view raw, std::string_view target);

    /// @brief Record one replayed edit for @p version.
    void onEdit(std::string_view version, std::string_view edit);

    /// @brief Record a table made visible to readers.
    void onTablePublished(std::string_view version,
                          std::string_view parent,
                          size_t edits,
                          size_t opcodes);

    /// @brief Record a table that failed validation and was withheld.
    void onTableRejected(std::string_view version, const Diagnostic &diag);

    /// @brief Free-form summary line.
    void note(std::string_view text);

  private:
    std::ostream &stream() const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace pymagic::support
