//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/opcodes/OpcodeFlags.cpp
// Purpose: String forms of opcode categories.
// Key invariants: Names are stable; tests and traces depend on them.
// Ownership/Lifetime: Stateless.
// Links: docs/opcodes.md
//
//===----------------------------------------------------------------------===//

#include "opcodes/OpcodeFlags.hpp"

namespace pymagic::opcodes
{

const char *toString(OpcodeFlag flag)
{
    switch (flag)
    {
        case OpcodeFlag::None:
            return "none";
        case OpcodeFlag::RelativeJump:
            return "hasjrel";
        case OpcodeFlag::AbsoluteJump:
            return "hasjabs";
        case OpcodeFlag::ConstIndex:
            return "hasconst";
        case OpcodeFlag::LocalIndex:
            return "haslocal";
        case OpcodeFlag::FreeIndex:
            return "hasfree";
        case OpcodeFlag::NameIndex:
            return "hasname";
        case OpcodeFlag::CompareIndex:
            return "hascompare";
        case OpcodeFlag::NoArgument:
            return "noarg";
    }
    return "";
}

size_t flagIndex(OpcodeFlag flag)
{
    for (size_t i = 0; i < kAllOpcodeFlags.size(); ++i)
    {
        if (kAllOpcodeFlags[i] == flag)
            return i;
    }
    return kAllOpcodeFlags.size();
}

std::string OpcodeFlags::toString() const
{
    if (empty())
        return "-";
    std::string out;
    for (OpcodeFlag flag : kAllOpcodeFlags)
    {
        if (!has(flag))
            continue;
        if (!out.empty())
            out += '|';
        out += opcodes::toString(flag);
    }
    return out;
}

} // namespace pymagic::opcodes
