#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "intcode/common/diagnostic.hpp"
#include "intcode/vm/interactive_io.hpp"
#include "intcode/vm/scripted_io.hpp"

namespace intcode::vm {
namespace {

// =============================================================================
// ScriptedIo
// =============================================================================

TEST(ScriptedIoTest, FeedsInputsInOrder) {
  ScriptedIo io({4, -2});
  EXPECT_EQ(io.RequestInput(), std::optional<Word>{4});
  EXPECT_EQ(io.RequestInput(), std::optional<Word>{-2});
  EXPECT_EQ(io.InputsConsumed(), 2);
}

TEST(ScriptedIoTest, RecordsOutputs) {
  ScriptedIo io;
  EXPECT_FALSE(io.LastOutput().has_value());
  io.EmitOutput(1);
  io.EmitOutput(2);
  EXPECT_EQ(io.Outputs(), (std::vector<Word>{1, 2}));
  EXPECT_EQ(io.LastOutput(), std::optional<Word>{2});
}

TEST(ScriptedIoTest, ExhaustionThrowsHostError) {
  ScriptedIo io({1});
  io.RequestInput();
  try {
    io.RequestInput();
    FAIL() << "expected DiagnosticException";
  } catch (const DiagnosticException& e) {
    const auto& primary = e.GetDiagnostic().primary;
    EXPECT_EQ(primary.kind, DiagKind::kHostError);
    EXPECT_NE(primary.message.find("input #2"), std::string::npos);
    EXPECT_NE(primary.message.find("only 1 value(s)"), std::string::npos);
  }
}

// =============================================================================
// InteractiveIo
// =============================================================================

TEST(InteractiveIoTest, PromptsAndReadsOneLine) {
  std::istringstream in("42\n");
  std::ostringstream out;
  InteractiveIo io(in, out);
  EXPECT_EQ(io.RequestInput(), std::optional<Word>{42});
  EXPECT_EQ(out.str(), "Input required.\n");
}

TEST(InteractiveIoTest, RepromptsOnMalformedLine) {
  std::istringstream in("abc\n\n  -17  \n");
  std::ostringstream out;
  InteractiveIo io(in, out);
  EXPECT_EQ(io.RequestInput(), std::optional<Word>{-17});
  EXPECT_EQ(
      out.str(),
      "Input required.\n"
      "Invalid integer, try again.\n"
      "Invalid integer, try again.\n");
}

TEST(InteractiveIoTest, EndOfStreamClosesInput) {
  std::istringstream in("oops\n");
  std::ostringstream out;
  InteractiveIo io(in, out);
  EXPECT_FALSE(io.RequestInput().has_value());
}

TEST(InteractiveIoTest, OutputOnePerLine) {
  std::istringstream in;
  std::ostringstream out;
  InteractiveIo io(in, out);
  io.EmitOutput(3);
  io.EmitOutput(-9);
  EXPECT_EQ(out.str(), "3\n-9\n");
}

// =============================================================================
// ParseWordLine
// =============================================================================

TEST(ParseWordLineTest, AcceptsSignedIntegers) {
  EXPECT_EQ(ParseWordLine("0"), std::optional<Word>{0});
  EXPECT_EQ(ParseWordLine("+12"), std::optional<Word>{12});
  EXPECT_EQ(ParseWordLine("-12"), std::optional<Word>{-12});
  EXPECT_EQ(ParseWordLine(" 7\r"), std::optional<Word>{7});
  EXPECT_EQ(
      ParseWordLine("9223372036854775807"),
      std::optional<Word>{9223372036854775807});
}

TEST(ParseWordLineTest, RejectsEverythingElse) {
  EXPECT_FALSE(ParseWordLine("").has_value());
  EXPECT_FALSE(ParseWordLine("   ").has_value());
  EXPECT_FALSE(ParseWordLine("1.5").has_value());
  EXPECT_FALSE(ParseWordLine("12a").has_value());
  EXPECT_FALSE(ParseWordLine("+-3").has_value());
  EXPECT_FALSE(ParseWordLine("1 2").has_value());
  EXPECT_FALSE(ParseWordLine("99999999999999999999").has_value());
}

}  // namespace
}  // namespace intcode::vm
