#pragma once

#include "intcode/common/diagnostic.hpp"
#include "intcode/vm/instruction.hpp"
#include "intcode/vm/memory.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::vm {

// Opcode part of an instruction word (its two low decimal digits).
auto OpcodeOf(Word instruction) -> Word;

// Raw addressing-mode digit for operand 1, 2 or 3.
auto ModeDigitOf(Word instruction, int operand) -> Word;

// Decode the instruction at `pc`. Pure: reads memory without growing it, so
// decoding the same state twice yields equal instructions. Unknown opcodes,
// unknown addressing modes and negative addresses are reported as errors
// located at `pc`. An immediate destination decodes as-is; the engine rejects
// the write.
auto Decode(const Memory& memory, Address pc, Word relative_base)
    -> Result<Instruction>;

}  // namespace intcode::vm
