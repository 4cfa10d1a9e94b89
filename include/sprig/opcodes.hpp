#pragma once
#include <cstdint>

namespace sprig
{

/** Instruction set. One byte per opcode, values from opcodes.def. */
enum class Op : std::uint8_t
{
#define OP(name, val, mnem, cls) name = val,
#include <sprig/opcodes.def>
#undef OP
};

// -----------------------------------------------------------------------------
// Instruction class for pattern guards in the optimizer and validator
// -----------------------------------------------------------------------------
enum class OpClass : uint8_t
{
  Arith,    // ADD, SUB, ..., BXOR
  Unary,    // BNOT
  Compare,  // LT, GT, EQ, NE
  Stack,    // DUP, DROP, SWAP, OVER, ROT
  Cast,     // TO_INT, TO_FLOAT, TO_STR, TO_BOOL
  Control,  // CALL, RET, JMP, IF, EXIT, NOP
  Logic,    // AND, OR, NOT
  Io,       // READ, WRITE, PRINT
  Literal,  // LIT_TRUE, LIT_FALSE
};

// -----------------------------------------------------------------------------
// Instruction entry definition
// -----------------------------------------------------------------------------
struct InstructionEntry
{
  const char* mnemonic;
  Op op;
  OpClass cls;
};

// -----------------------------------------------------------------------------
// Helper macro to convert class token to OpClass enum
// -----------------------------------------------------------------------------
#define OP_CLASS_ARITH OpClass::Arith
#define OP_CLASS_UNARY OpClass::Unary
#define OP_CLASS_COMPARE OpClass::Compare
#define OP_CLASS_STACK OpClass::Stack
#define OP_CLASS_CAST OpClass::Cast
#define OP_CLASS_CONTROL OpClass::Control
#define OP_CLASS_LOGIC OpClass::Logic
#define OP_CLASS_IO OpClass::Io
#define OP_CLASS_LITERAL OpClass::Literal

// -----------------------------------------------------------------------------
// Instruction table (generated from opcodes.def). Immutable, process-wide.
// -----------------------------------------------------------------------------
static constexpr InstructionEntry kInstructionTable[] = {
#define OP(name, val, mnem, cls) {mnem, Op::name, OP_CLASS_##cls},
#include <sprig/opcodes.def>
#undef OP
};

static constexpr int kInstructionCount =
    static_cast<int>(sizeof(kInstructionTable) / sizeof(kInstructionTable[0]));

// -----------------------------------------------------------------------------
// Subroutine delimiters
// -----------------------------------------------------------------------------
static constexpr const char* kWordOpen = ":";
static constexpr const char* kWordClose = ";";

}  // namespace sprig
