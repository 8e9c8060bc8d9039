//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/opcodes/EditOperation.cpp
// Purpose: Factories and formatting for opcode table edits.
// Key invariants: None.
// Ownership/Lifetime: Value type.
// Links: docs/opcodes.md
//
//===----------------------------------------------------------------------===//

#include "opcodes/EditOperation.hpp"

namespace pymagic::opcodes
{

EditOperation EditOperation::define(std::string_view name, uint8_t code, OpcodeFlags flags)
{
    return EditOperation{Kind::Define, std::string(name), code, flags};
}

EditOperation EditOperation::remove(std::string_view name, uint8_t code)
{
    return EditOperation{Kind::Remove, std::string(name), code, OpcodeFlags{}};
}

EditOperation EditOperation::alias(std::string_view name, uint8_t code, OpcodeFlags flags)
{
    return EditOperation{Kind::Alias, std::string(name), code, flags};
}

EditOperation EditOperation::redefine(std::string_view name, uint8_t code, OpcodeFlags flags)
{
    return EditOperation{Kind::Redefine, std::string(name), code, flags};
}

OpcodeDefinition EditOperation::definition() const
{
    return OpcodeDefinition{name, code, flags, kind == Kind::Alias};
}

std::string EditOperation::toString() const
{
    std::string out = opcodes::toString(kind);
    out += ' ';
    out += name;
    out += ' ';
    out += std::to_string(code);
    if (kind != Kind::Remove)
        out += " [" + flags.toString() + "]";
    return out;
}

const char *toString(EditOperation::Kind kind)
{
    switch (kind)
    {
        case EditOperation::Kind::Define:
            return "define";
        case EditOperation::Kind::Remove:
            return "remove";
        case EditOperation::Kind::Alias:
            return "alias";
        case EditOperation::Kind::Redefine:
            return "redefine";
    }
    return "";
}

} // namespace pymagic::opcodes
