//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/pymagic/Registry.hpp
// Purpose: Stable façade exposing the registry builder and its query types.
// Key invariants: Mirrors registry::Registry and registry::RegistryBuilder only.
// Ownership/Lifetime: Callers own the returned registry.
// Links: docs/codemap.md
#pragma once

#include "registry/Registry.hpp"

/// @file include/pymagic/Registry.hpp
/// @brief Public forwarding header providing the catalog registry without
///        requiring downstreams to include src/ paths.

namespace pymagic
{
using registry::Registry;
using registry::RegistryBuilder;
} // namespace pymagic
