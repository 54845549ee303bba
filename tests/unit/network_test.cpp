#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "intcode/common/diagnostic.hpp"
#include "intcode/runtime/network.hpp"
#include "intcode/runtime/phase_search.hpp"
#include "intcode/vm/engine.hpp"

namespace intcode::runtime {
namespace {

// Reads a phase and a signal, outputs signal * 10 + phase
const std::vector<Word> kDigitChain = {3, 15, 3,  16, 1002, 16, 10, 16, 1,
                                       16, 15, 15, 4, 15,   99, 0,  0};

// Feedback program: loops five times before halting
const std::vector<Word> kCountdownRing = {
    3,  26, 1001, 26,   -4, 26, 3,  27, 1002, 27, 2,  27, 1, 27, 26,
    27, 4,  27,   1001, 28, -1, 28, 1005, 28, 6,  99, 0,  0, 5};

class NetworkTest : public ::testing::Test {};

// =============================================================================
// Chains
// =============================================================================

TEST_F(NetworkTest, ChainConcatenatesDigits) {
  auto network = ProcessNetwork::Replicated(
      kDigitChain, {4, 3, 2, 1, 0}, Topology::kChain);
  auto outcome = network.Run();
  ASSERT_TRUE(outcome.has_value()) << FormatDiagnostic(outcome.error());
  EXPECT_EQ(outcome->final_signal, 43210);
  EXPECT_EQ(outcome->observed, std::vector<Word>{43210});

  ASSERT_EQ(outcome->engines.size(), 5);
  for (std::size_t i = 0; i < outcome->engines.size(); ++i) {
    const auto& report = outcome->engines[i];
    EXPECT_EQ(report.index, i);
    EXPECT_EQ(report.exit_reason, vm::ExitReason::kHalted);
    EXPECT_FALSE(report.failure.has_value());
    EXPECT_EQ(report.dropped_outputs, 0);
  }
  EXPECT_EQ(outcome->engines[0].phase, 4);
}

TEST_F(NetworkTest, InitialSignalFeedsFirstEngine) {
  auto network =
      ProcessNetwork::Replicated(kDigitChain, {1, 2}, Topology::kChain, 7);
  auto outcome = network.Run();
  ASSERT_TRUE(outcome.has_value()) << FormatDiagnostic(outcome.error());
  EXPECT_EQ(outcome->final_signal, 712);
}

TEST_F(NetworkTest, DifferentProgramsPerEngine) {
  // phase + signal, then phase * signal
  std::vector<Word> add = {3, 0, 3, 1, 1, 0, 1, 0, 4, 0, 99};
  std::vector<Word> mul = {3, 0, 3, 1, 2, 0, 1, 0, 4, 0, 99};
  ProcessNetwork network({add, mul}, {1, 3}, Topology::kChain, 4);
  auto outcome = network.Run();
  ASSERT_TRUE(outcome.has_value()) << FormatDiagnostic(outcome.error());
  EXPECT_EQ(outcome->final_signal, 15);
}

TEST_F(NetworkTest, UnreadInputIsHarmless) {
  auto network =
      ProcessNetwork::Replicated({104, 5, 99}, {0}, Topology::kChain);
  auto outcome = network.Run();
  ASSERT_TRUE(outcome.has_value()) << FormatDiagnostic(outcome.error());
  EXPECT_EQ(outcome->final_signal, 5);
}

TEST_F(NetworkTest, RepeatedRunsAgree) {
  auto network = ProcessNetwork::Replicated(
      kCountdownRing, {9, 8, 7, 6, 5}, Topology::kRing);
  auto first = network.Run();
  auto second = network.Run();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->observed, second->observed);
}

// =============================================================================
// Rings
// =============================================================================

TEST_F(NetworkTest, RingFeedsBackUntilHalt) {
  auto network = ProcessNetwork::Replicated(
      kCountdownRing, {9, 8, 7, 6, 5}, Topology::kRing);
  auto outcome = network.Run();
  ASSERT_TRUE(outcome.has_value()) << FormatDiagnostic(outcome.error());
  EXPECT_EQ(outcome->final_signal, 139629729);
  // One value per loop iteration
  EXPECT_EQ(outcome->observed.size(), 5);
}

TEST_F(NetworkTest, RingToleratesEarlyHalt) {
  // Each engine echoes one value and halts; the forwarded value is never
  // consumed.
  auto network =
      ProcessNetwork::Replicated({3, 0, 4, 0, 99}, {1, 2}, Topology::kRing);
  auto outcome = network.Run();
  ASSERT_TRUE(outcome.has_value()) << FormatDiagnostic(outcome.error());
  EXPECT_EQ(outcome->observed, std::vector<Word>{2});
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(NetworkTest, MemberFailureIsReported) {
  std::vector<Word> good = {3, 0, 3, 1, 1, 0, 1, 0, 4, 0, 99};
  std::vector<Word> bad = {3, 0, 98};
  ProcessNetwork network({good, bad}, {0, 6}, Topology::kChain);
  auto outcome = network.Run();
  ASSERT_FALSE(outcome.has_value());
  auto text = FormatDiagnostic(outcome.error());
  EXPECT_NE(text.find("unrecognized opcode 98"), std::string::npos) << text;
  EXPECT_NE(text.find("in engine 1 (phase 6)"), std::string::npos) << text;
}

TEST_F(NetworkTest, PhaseCountMustMatch) {
  ProcessNetwork network({kDigitChain}, {0, 1}, Topology::kChain);
  auto outcome = network.Run();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().primary.kind, DiagKind::kHostError);
  EXPECT_NE(
      outcome.error().primary.message.find("1 program(s) but 2 phase"),
      std::string::npos);
}

TEST_F(NetworkTest, EmptyNetworkIsRejected) {
  ProcessNetwork network({}, {}, Topology::kChain);
  EXPECT_FALSE(network.Run().has_value());
}

TEST_F(NetworkTest, SilentNetworkIsAnError) {
  auto network = ProcessNetwork::Replicated({99}, {0, 1}, Topology::kChain);
  auto outcome = network.Run();
  ASSERT_FALSE(outcome.has_value());
  EXPECT_NE(
      outcome.error().primary.message.find("produced no output"),
      std::string::npos);
}

// =============================================================================
// Phase search
// =============================================================================

TEST_F(NetworkTest, SearchFindsBestChainOrdering) {
  auto best = FindMaxSignal(kDigitChain, {0, 1, 2, 3, 4}, Topology::kChain);
  ASSERT_TRUE(best.has_value()) << FormatDiagnostic(best.error());
  EXPECT_EQ(best->signal, 43210);
  EXPECT_EQ(best->phases, (std::vector<Word>{4, 3, 2, 1, 0}));
  EXPECT_EQ(best->permutations_tried, 120);
}

TEST_F(NetworkTest, SearchFindsBestRingOrdering) {
  auto best = FindMaxSignal(kCountdownRing, {5, 6, 7, 8, 9}, Topology::kRing);
  ASSERT_TRUE(best.has_value()) << FormatDiagnostic(best.error());
  EXPECT_EQ(best->signal, 139629729);
  EXPECT_EQ(best->phases, (std::vector<Word>{9, 8, 7, 6, 5}));
}

TEST_F(NetworkTest, SearchOrderOfPhaseSetDoesNotMatter) {
  auto best = FindMaxSignal(kDigitChain, {3, 0, 4, 1, 2}, Topology::kChain);
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->signal, 43210);
}

TEST_F(NetworkTest, SearchTiesKeepFirstOrdering) {
  // Ignores its phase: every ordering gives the same signal
  std::vector<Word> constant = {3, 0, 104, 11, 99};
  auto best = FindMaxSignal(constant, {2, 1, 0}, Topology::kChain);
  ASSERT_TRUE(best.has_value()) << FormatDiagnostic(best.error());
  EXPECT_EQ(best->signal, 11);
  EXPECT_EQ(best->phases, (std::vector<Word>{0, 1, 2}));
  EXPECT_EQ(best->permutations_tried, 6);
}

TEST_F(NetworkTest, SearchNeedsPhases) {
  auto best = FindMaxSignal(kDigitChain, {}, Topology::kChain);
  ASSERT_FALSE(best.has_value());
  EXPECT_EQ(best.error().primary.kind, DiagKind::kHostError);
}

TEST_F(NetworkTest, SearchFailureNamesOrdering) {
  auto best = FindMaxSignal({3, 0, 98}, {0, 1}, Topology::kChain);
  ASSERT_FALSE(best.has_value());
  auto text = FormatDiagnostic(best.error());
  EXPECT_NE(text.find("with phases 0,1"), std::string::npos) << text;
}

}  // namespace
}  // namespace intcode::runtime
