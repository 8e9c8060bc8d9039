//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/catalog/OpcodeCatalog.cpp
// Purpose: Literal opcode catalogs for the root releases and the edit
//          sequences that derive later releases from them.
// Key invariants: Opcodes below kHaveArgument are marked NoArgument.
//                 Renumbering an existing mnemonic is always a Redefine.
// Ownership/Lifetime: Every function returns a fresh vector.
// Links: docs/opcodes.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief CPython opcode history.
/// @details Two lines are rooted in literal tables: 2.6 for the 2.x series and
///          3.2 for 3.x.  Each later release lists only what changed relative
///          to its parent, in the order CPython made the change.

#include "catalog/Catalog.hpp"

#include "opcodes/InstructionSetBuilder.hpp"

namespace pymagic::catalog
{
namespace
{
using opcodes::EditOperation;
using opcodes::OpcodeDefinition;
using opcodes::OpcodeFlag;
using opcodes::OpcodeFlags;

constexpr OpcodeFlags kConst = OpcodeFlag::ConstIndex;
constexpr OpcodeFlags kName = OpcodeFlag::NameIndex;
constexpr OpcodeFlags kLocal = OpcodeFlag::LocalIndex;
constexpr OpcodeFlags kFree = OpcodeFlag::FreeIndex;
constexpr OpcodeFlags kCompare = OpcodeFlag::CompareIndex;
constexpr OpcodeFlags kJrel = OpcodeFlag::RelativeJump;
constexpr OpcodeFlags kJabs = OpcodeFlag::AbsoluteJump;

OpcodeFlags withArgumentFlag(uint8_t code, OpcodeFlags flags)
{
    if (code < opcodes::kHaveArgument)
        flags |= OpcodeFlag::NoArgument;
    return flags;
}

OpcodeDefinition op(const char *name, uint8_t code, OpcodeFlags flags = {})
{
    return OpcodeDefinition{name, code, withArgumentFlag(code, flags), false};
}

EditOperation add(const char *name, uint8_t code, OpcodeFlags flags = {})
{
    return EditOperation::define(name, code, withArgumentFlag(code, flags));
}

EditOperation rm(const char *name, uint8_t code)
{
    return EditOperation::remove(name, code);
}

EditOperation redef(const char *name, uint8_t code, OpcodeFlags flags = {})
{
    return EditOperation::redefine(name, code, withArgumentFlag(code, flags));
}
} // namespace

std::vector<OpcodeDefinition> python26Opcodes()
{
    return {
        op("STOP_CODE", 0),
        op("POP_TOP", 1),
        op("ROT_TWO", 2),
        op("ROT_THREE", 3),
        op("DUP_TOP", 4),
        op("ROT_FOUR", 5),
        op("NOP", 9),
        op("UNARY_POSITIVE", 10),
        op("UNARY_NEGATIVE", 11),
        op("UNARY_NOT", 12),
        op("UNARY_CONVERT", 13),
        op("UNARY_INVERT", 15),
        op("LIST_APPEND", 18),
        op("BINARY_POWER", 19),
        op("BINARY_MULTIPLY", 20),
        op("BINARY_DIVIDE", 21),
        op("BINARY_MODULO", 22),
        op("BINARY_ADD", 23),
        op("BINARY_SUBTRACT", 24),
        op("BINARY_SUBSCR", 25),
        op("BINARY_FLOOR_DIVIDE", 26),
        op("BINARY_TRUE_DIVIDE", 27),
        op("INPLACE_FLOOR_DIVIDE", 28),
        op("INPLACE_TRUE_DIVIDE", 29),
        op("SLICE+0", 30),
        op("SLICE+1", 31),
        op("SLICE+2", 32),
        op("SLICE+3", 33),
        op("STORE_SLICE+0", 40),
        op("STORE_SLICE+1", 41),
        op("STORE_SLICE+2", 42),
        op("STORE_SLICE+3", 43),
        op("DELETE_SLICE+0", 50),
        op("DELETE_SLICE+1", 51),
        op("DELETE_SLICE+2", 52),
        op("DELETE_SLICE+3", 53),
        op("STORE_MAP", 54),
        op("INPLACE_ADD", 55),
        op("INPLACE_SUBTRACT", 56),
        op("INPLACE_MULTIPLY", 57),
        op("INPLACE_DIVIDE", 58),
        op("INPLACE_MODULO", 59),
        op("STORE_SUBSCR", 60),
        op("DELETE_SUBSCR", 61),
        op("BINARY_LSHIFT", 62),
        op("BINARY_RSHIFT", 63),
        op("BINARY_AND", 64),
        op("BINARY_XOR", 65),
        op("BINARY_OR", 66),
        op("INPLACE_POWER", 67),
        op("GET_ITER", 68),
        op("PRINT_EXPR", 70),
        op("PRINT_ITEM", 71),
        op("PRINT_NEWLINE", 72),
        op("PRINT_ITEM_TO", 73),
        op("PRINT_NEWLINE_TO", 74),
        op("INPLACE_LSHIFT", 75),
        op("INPLACE_RSHIFT", 76),
        op("INPLACE_AND", 77),
        op("INPLACE_XOR", 78),
        op("INPLACE_OR", 79),
        op("BREAK_LOOP", 80),
        op("WITH_CLEANUP", 81),
        op("LOAD_LOCALS", 82),
        op("RETURN_VALUE", 83),
        op("IMPORT_STAR", 84),
        op("EXEC_STMT", 85),
        op("YIELD_VALUE", 86),
        op("POP_BLOCK", 87),
        op("END_FINALLY", 88),
        op("BUILD_CLASS", 89),
        op("STORE_NAME", 90, kName),
        op("DELETE_NAME", 91, kName),
        op("UNPACK_SEQUENCE", 92),
        op("FOR_ITER", 93, kJrel),
        op("STORE_ATTR", 95, kName),
        op("DELETE_ATTR", 96, kName),
        op("STORE_GLOBAL", 97, kName),
        op("DELETE_GLOBAL", 98, kName),
        op("DUP_TOPX", 99),
        op("LOAD_CONST", 100, kConst),
        op("LOAD_NAME", 101, kName),
        op("BUILD_TUPLE", 102),
        op("BUILD_LIST", 103),
        op("BUILD_MAP", 104),
        op("LOAD_ATTR", 105, kName),
        op("COMPARE_OP", 106, kCompare),
        op("IMPORT_NAME", 107, kName),
        op("IMPORT_FROM", 108, kName),
        op("JUMP_FORWARD", 110, kJrel),
        op("JUMP_IF_FALSE", 111, kJrel),
        op("JUMP_IF_TRUE", 112, kJrel),
        op("JUMP_ABSOLUTE", 113, kJabs),
        op("LOAD_GLOBAL", 116, kName),
        op("CONTINUE_LOOP", 119, kJabs),
        op("SETUP_LOOP", 120, kJrel),
        op("SETUP_EXCEPT", 121, kJrel),
        op("SETUP_FINALLY", 122, kJrel),
        op("LOAD_FAST", 124, kLocal),
        op("STORE_FAST", 125, kLocal),
        op("DELETE_FAST", 126, kLocal),
        op("RAISE_VARARGS", 130),
        op("CALL_FUNCTION", 131),
        op("MAKE_FUNCTION", 132),
        op("BUILD_SLICE", 133),
        op("MAKE_CLOSURE", 134),
        op("LOAD_CLOSURE", 135, kFree),
        op("LOAD_DEREF", 136, kFree),
        op("STORE_DEREF", 137, kFree),
        op("CALL_FUNCTION_VAR", 140),
        op("CALL_FUNCTION_KW", 141),
        op("CALL_FUNCTION_VAR_KW", 142),
        op("EXTENDED_ARG", 143),
    };
}

/// 2.7 renumbers the attribute/import block upward by one to make room for
/// BUILD_SET, so the moves run from the top down.
std::vector<EditOperation> python27Edits()
{
    return {
        redef("LIST_APPEND", 94),
        redef("IMPORT_FROM", 109, kName),
        redef("IMPORT_NAME", 108, kName),
        redef("COMPARE_OP", 107, kCompare),
        redef("LOAD_ATTR", 106, kName),
        redef("BUILD_MAP", 105),
        add("BUILD_SET", 104),
        rm("JUMP_IF_FALSE", 111),
        rm("JUMP_IF_TRUE", 112),
        add("JUMP_IF_FALSE_OR_POP", 111, kJabs),
        add("JUMP_IF_TRUE_OR_POP", 112, kJabs),
        add("POP_JUMP_IF_FALSE", 114, kJabs),
        add("POP_JUMP_IF_TRUE", 115, kJabs),
        redef("EXTENDED_ARG", 145),
        add("SETUP_WITH", 143, kJrel),
        add("SET_ADD", 146),
        add("MAP_ADD", 147),
    };
}

std::vector<OpcodeDefinition> python32Opcodes()
{
    return {
        op("STOP_CODE", 0),
        op("POP_TOP", 1),
        op("ROT_TWO", 2),
        op("ROT_THREE", 3),
        op("DUP_TOP", 4),
        op("DUP_TOP_TWO", 5),
        op("NOP", 9),
        op("UNARY_POSITIVE", 10),
        op("UNARY_NEGATIVE", 11),
        op("UNARY_NOT", 12),
        op("UNARY_INVERT", 15),
        op("BINARY_POWER", 19),
        op("BINARY_MULTIPLY", 20),
        op("BINARY_MODULO", 22),
        op("BINARY_ADD", 23),
        op("BINARY_SUBTRACT", 24),
        op("BINARY_SUBSCR", 25),
        op("BINARY_FLOOR_DIVIDE", 26),
        op("BINARY_TRUE_DIVIDE", 27),
        op("INPLACE_FLOOR_DIVIDE", 28),
        op("INPLACE_TRUE_DIVIDE", 29),
        op("STORE_MAP", 54),
        op("INPLACE_ADD", 55),
        op("INPLACE_SUBTRACT", 56),
        op("INPLACE_MULTIPLY", 57),
        op("INPLACE_MODULO", 59),
        op("STORE_SUBSCR", 60),
        op("DELETE_SUBSCR", 61),
        op("BINARY_LSHIFT", 62),
        op("BINARY_RSHIFT", 63),
        op("BINARY_AND", 64),
        op("BINARY_XOR", 65),
        op("BINARY_OR", 66),
        op("INPLACE_POWER", 67),
        op("GET_ITER", 68),
        op("STORE_LOCALS", 69),
        op("PRINT_EXPR", 70),
        op("LOAD_BUILD_CLASS", 71),
        op("INPLACE_LSHIFT", 75),
        op("INPLACE_RSHIFT", 76),
        op("INPLACE_AND", 77),
        op("INPLACE_XOR", 78),
        op("INPLACE_OR", 79),
        op("BREAK_LOOP", 80),
        op("WITH_CLEANUP", 81),
        op("RETURN_VALUE", 83),
        op("IMPORT_STAR", 84),
        op("YIELD_VALUE", 86),
        op("POP_BLOCK", 87),
        op("END_FINALLY", 88),
        op("POP_EXCEPT", 89),
        op("STORE_NAME", 90, kName),
        op("DELETE_NAME", 91, kName),
        op("UNPACK_SEQUENCE", 92),
        op("FOR_ITER", 93, kJrel),
        op("UNPACK_EX", 94),
        op("STORE_ATTR", 95, kName),
        op("DELETE_ATTR", 96, kName),
        op("STORE_GLOBAL", 97, kName),
        op("DELETE_GLOBAL", 98, kName),
        op("LOAD_CONST", 100, kConst),
        op("LOAD_NAME", 101, kName),
        op("BUILD_TUPLE", 102),
        op("BUILD_LIST", 103),
        op("BUILD_SET", 104),
        op("BUILD_MAP", 105),
        op("LOAD_ATTR", 106, kName),
        op("COMPARE_OP", 107, kCompare),
        op("IMPORT_NAME", 108, kName),
        op("IMPORT_FROM", 109, kName),
        op("JUMP_FORWARD", 110, kJrel),
        op("JUMP_IF_FALSE_OR_POP", 111, kJabs),
        op("JUMP_IF_TRUE_OR_POP", 112, kJabs),
        op("JUMP_ABSOLUTE", 113, kJabs),
        op("POP_JUMP_IF_FALSE", 114, kJabs),
        op("POP_JUMP_IF_TRUE", 115, kJabs),
        op("LOAD_GLOBAL", 116, kName),
        op("CONTINUE_LOOP", 119, kJabs),
        op("SETUP_LOOP", 120, kJrel),
        op("SETUP_EXCEPT", 121, kJrel),
        op("SETUP_FINALLY", 122, kJrel),
        op("LOAD_FAST", 124, kLocal),
        op("STORE_FAST", 125, kLocal),
        op("DELETE_FAST", 126, kLocal),
        op("RAISE_VARARGS", 130),
        op("CALL_FUNCTION", 131),
        op("MAKE_FUNCTION", 132),
        op("BUILD_SLICE", 133),
        op("MAKE_CLOSURE", 134),
        op("LOAD_CLOSURE", 135, kFree),
        op("LOAD_DEREF", 136, kFree),
        op("STORE_DEREF", 137, kFree),
        op("DELETE_DEREF", 138, kFree),
        op("CALL_FUNCTION_VAR", 140),
        op("CALL_FUNCTION_KW", 141),
        op("CALL_FUNCTION_VAR_KW", 142),
        op("SETUP_WITH", 143, kJrel),
        op("EXTENDED_ARG", 144),
        op("LIST_APPEND", 145),
        op("SET_ADD", 146),
        op("MAP_ADD", 147),
    };
}

std::vector<EditOperation> python33Edits()
{
    return {
        add("YIELD_FROM", 72),
    };
}

std::vector<EditOperation> python34Edits()
{
    return {
        rm("STOP_CODE", 0),
        rm("STORE_LOCALS", 69),
        add("LOAD_CLASSDEREF", 148, kFree),
    };
}

std::vector<EditOperation> python35Edits()
{
    return {
        rm("WITH_CLEANUP", 81),
        rm("STORE_MAP", 54),
        add("BINARY_MATRIX_MULTIPLY", 16),
        add("INPLACE_MATRIX_MULTIPLY", 17),
        add("GET_AITER", 50),
        add("GET_ANEXT", 51),
        add("BEFORE_ASYNC_WITH", 52),
        add("GET_YIELD_FROM_ITER", 69),
        add("GET_AWAITABLE", 73),
        add("WITH_CLEANUP_START", 81),
        add("WITH_CLEANUP_FINISH", 82),
        add("BUILD_LIST_UNPACK", 149),
        add("BUILD_MAP_UNPACK", 150),
        add("BUILD_MAP_UNPACK_WITH_CALL", 151),
        add("BUILD_TUPLE_UNPACK", 152),
        add("BUILD_SET_UNPACK", 153),
        add("SETUP_ASYNC_WITH", 154),
    };
}

std::vector<EditOperation> python36Edits()
{
    return {
        rm("MAKE_CLOSURE", 134),
        rm("CALL_FUNCTION_VAR", 140),
        rm("CALL_FUNCTION_VAR_KW", 142),
        add("SETUP_ANNOTATIONS", 85),
        add("STORE_ANNOTATION", 127, kName),
        add("CALL_FUNCTION_EX", 142),
        add("FORMAT_VALUE", 155),
        add("BUILD_CONST_KEY_MAP", 156),
        add("BUILD_STRING", 157),
        add("BUILD_TUPLE_UNPACK_WITH_CALL", 158),
    };
}

support::Expected<void> loadOpcodeCatalog(opcodes::InstructionSetBuilder &builder)
{
    struct Derivation
    {
        const char *version;
        const char *parent;
        std::vector<EditOperation> (*edits)();
    };
    static const Derivation kDerivations[] = {
        {"2.7", "2.6a1", python27Edits},
        {"3.3a4", "3.2a2", python33Edits},
        {"3.4rc2", "3.3a4", python34Edits},
        {"3.5", "3.4rc2", python35Edits},
        {"3.6rc1", "3.5", python36Edits},
    };

    if (auto root = builder.defineRootTable("2.6a1", python26Opcodes()); !root)
        return root.error();
    if (auto root = builder.defineRootTable("3.2a2", python32Opcodes()); !root)
        return root.error();

    for (const auto &step : kDerivations)
    {
        if (auto table = builder.defineTable(step.version, step.parent, step.edits()); !table)
            return table.error();
    }
    return {};
}

} // namespace pymagic::catalog
