#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <variant>

#include <fmt/core.h>

#include "intcode/common/diagnostic.hpp"
#include "intcode/vm/decoder.hpp"
#include "intcode/vm/instruction.hpp"
#include "intcode/vm/memory.hpp"

namespace intcode::vm {
namespace {

class DecoderTest : public ::testing::Test {};

// =============================================================================
// Instruction word fields
// =============================================================================

TEST_F(DecoderTest, OpcodeIsLowTwoDigits) {
  EXPECT_EQ(OpcodeOf(1002), 2);
  EXPECT_EQ(OpcodeOf(99), 99);
  EXPECT_EQ(OpcodeOf(21101), 1);
}

TEST_F(DecoderTest, ModeDigitsReadRightToLeft) {
  EXPECT_EQ(ModeDigitOf(1002, 1), 0);
  EXPECT_EQ(ModeDigitOf(1002, 2), 1);
  EXPECT_EQ(ModeDigitOf(1002, 3), 0);
  EXPECT_EQ(ModeDigitOf(21101, 1), 1);
  EXPECT_EQ(ModeDigitOf(21101, 2), 1);
  EXPECT_EQ(ModeDigitOf(21101, 3), 2);
}

// =============================================================================
// Decoding
// =============================================================================

TEST_F(DecoderTest, PositionAndImmediateOperands) {
  Memory memory({1002, 4, 3, 4, 33});
  auto instr = Decode(memory, 0, 0);
  ASSERT_TRUE(instr.has_value()) << FormatDiagnostic(instr.error());

  Instruction expected = Multiply{
      .lhs = Indirect{.address = 4},
      .rhs = Immediate{.value = 3},
      .dest = Indirect{.address = 4},
  };
  EXPECT_EQ(*instr, expected);
  EXPECT_EQ(InstructionWidth(*instr), 4);
}

TEST_F(DecoderTest, RelativeOperandAddsBase) {
  Memory memory({204, -3});
  auto instr = Decode(memory, 0, 10);
  ASSERT_TRUE(instr.has_value()) << FormatDiagnostic(instr.error());
  EXPECT_EQ(*instr, Instruction{Output{.source = Indirect{.address = 7}}});
}

TEST_F(DecoderTest, HaltHasNoOperands) {
  Memory memory({99});
  auto instr = Decode(memory, 0, 0);
  ASSERT_TRUE(instr.has_value());
  EXPECT_TRUE(std::holds_alternative<Halt>(*instr));
  EXPECT_EQ(InstructionWidth(*instr), 1);
}

TEST_F(DecoderTest, ImmediateDestinationDecodes) {
  Memory memory({11101, 1, 1, 0, 99});
  auto instr = Decode(memory, 0, 0);
  ASSERT_TRUE(instr.has_value());
  const auto& add = std::get<Add>(*instr);
  EXPECT_EQ(add.dest, Parameter{Immediate{.value = 0}});
}

TEST_F(DecoderTest, OperandsPastEndReadAsZero) {
  Memory memory({1, 0});
  auto instr = Decode(memory, 0, 0);
  ASSERT_TRUE(instr.has_value());
  Instruction expected = Add{
      .lhs = Indirect{.address = 0},
      .rhs = Indirect{.address = 0},
      .dest = Indirect{.address = 0},
  };
  EXPECT_EQ(*instr, expected);
  EXPECT_EQ(memory.Size(), 2);
}

TEST_F(DecoderTest, DecodingTwiceGivesSameInstruction) {
  Memory memory({109, 19, 21101, 3, 4, -5, 99});
  auto first = Decode(memory, 2, 19);
  auto second = Decode(memory, 2, 19);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, *second);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(DecoderTest, UnknownOpcode) {
  Memory memory({1, 0, 0, 0, 42});
  auto instr = Decode(memory, 4, 0);
  ASSERT_FALSE(instr.has_value());
  const auto& primary = instr.error().primary;
  EXPECT_EQ(primary.kind, DiagKind::kError);
  ASSERT_TRUE(primary.location.has_value());
  EXPECT_EQ(primary.location->pc, 4);
  EXPECT_EQ(primary.location->instruction, 42);
  EXPECT_NE(
      primary.message.find("unrecognized opcode 42"), std::string::npos);
}

TEST_F(DecoderTest, UnknownAddressingMode) {
  Memory memory({301, 0, 0, 0});
  auto instr = Decode(memory, 0, 0);
  ASSERT_FALSE(instr.has_value());
  EXPECT_NE(
      instr.error().primary.message.find("unrecognized addressing mode 3"),
      std::string::npos);
}

TEST_F(DecoderTest, NegativePositionAddress) {
  Memory memory({4, -2, 99});
  auto instr = Decode(memory, 0, 0);
  ASSERT_FALSE(instr.has_value());
  EXPECT_NE(
      instr.error().primary.message.find("negative address -2"),
      std::string::npos);
}

TEST_F(DecoderTest, NegativeRelativeAddress) {
  Memory memory({204, 2, 99});
  auto instr = Decode(memory, 0, -5);
  ASSERT_FALSE(instr.has_value());
  EXPECT_NE(
      instr.error().primary.message.find("negative address -3"),
      std::string::npos);
}

TEST_F(DecoderTest, RelativeAddressOverflow) {
  Memory memory({204, 1, 99});
  auto instr = Decode(memory, 0, std::numeric_limits<Word>::max());
  ASSERT_FALSE(instr.has_value());
  const auto& primary = instr.error().primary;
  EXPECT_EQ(primary.kind, DiagKind::kError);
  ASSERT_TRUE(primary.location.has_value());
  EXPECT_EQ(primary.location->pc, 0);
  EXPECT_EQ(
      primary.message,
      "relative address 9223372036854775807 + 1 out of range in instruction "
      "204");
}

TEST_F(DecoderTest, RelativeAddressUnderflow) {
  Memory memory({204, -1, 99});
  auto instr = Decode(memory, 0, std::numeric_limits<Word>::min());
  ASSERT_FALSE(instr.has_value());
  EXPECT_NE(
      instr.error().primary.message.find("out of range"), std::string::npos);
}

// =============================================================================
// Text form
// =============================================================================

TEST_F(DecoderTest, ToStringShowsOperandModes) {
  Memory memory({1002, 4, 3, 4, 33});
  auto instr = Decode(memory, 0, 0);
  ASSERT_TRUE(instr.has_value());
  EXPECT_EQ(ToString(*instr), "mul [4], 3 -> [4]");
  EXPECT_EQ(fmt::format("{}", *instr), "mul [4], 3 -> [4]");
}

}  // namespace
}  // namespace intcode::vm
