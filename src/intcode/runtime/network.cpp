#include "intcode/runtime/network.hpp"

#include <cstddef>
#include <exception>
#include <expected>
#include <functional>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "intcode/common/diagnostic.hpp"
#include "intcode/common/internal_error.hpp"
#include "intcode/runtime/channel.hpp"
#include "intcode/runtime/channel_io.hpp"
#include "intcode/vm/engine.hpp"

namespace intcode::runtime {

namespace {

// Body of one engine thread. Writes only to its own report slot.
void RunMember(
    std::vector<Word> image, ChannelReceiver inbound, ChannelSender outbound,
    EngineReport& report) {
  ChannelIo io(std::move(inbound), std::move(outbound));
  vm::Engine engine(std::move(image), io);

  spdlog::debug("engine {} started (phase {})", report.index, report.phase);
  try {
    auto result = engine.Run();
    if (result) {
      report.exit_reason = *result;
      spdlog::debug(
          "engine {} {} after {} instructions", report.index,
          vm::ToString(*result), engine.StepsExecuted());
    } else {
      report.failure = std::move(result.error());
      spdlog::debug(
          "engine {} failed: {}", report.index,
          report.failure->primary.message);
    }
  } catch (const std::exception& e) {
    report.failure = Diagnostic::HostError(e.what());
  }
  // Neighbours must see end of stream even if this engine stopped early.
  io.Close();
  report.steps_executed = engine.StepsExecuted();
  report.dropped_outputs = io.DroppedOutputs();
}

}  // namespace

ProcessNetwork::ProcessNetwork(
    std::vector<std::vector<Word>> images, std::vector<Word> phases,
    Topology topology, Word initial_signal)
    : images_(std::move(images)),
      phases_(std::move(phases)),
      topology_(topology),
      initial_signal_(initial_signal) {
}

auto ProcessNetwork::Replicated(
    const std::vector<Word>& image, std::vector<Word> phases,
    Topology topology, Word initial_signal) -> ProcessNetwork {
  std::vector<std::vector<Word>> images(phases.size(), image);
  return {std::move(images), std::move(phases), topology, initial_signal};
}

auto ProcessNetwork::Run() const -> Result<NetworkOutcome> {
  const std::size_t count = images_.size();
  if (count == 0) {
    return std::unexpected(
        Diagnostic::HostError("process network needs at least one engine"));
  }
  if (phases_.size() != count) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "process network has {} program(s) but {} phase value(s)",
                count, phases_.size())));
  }

  spdlog::debug(
      "wiring {} engine(s) as a {} with phases [{}]", count,
      ToString(topology_), fmt::join(phases_, ","));

  // into[i] feeds engine i; the observer channel carries the last engine's
  // output.
  std::vector<ChannelSender> into_senders;
  std::vector<ChannelReceiver> into_receivers;
  into_senders.reserve(count);
  into_receivers.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto [sender, receiver] = MakeChannel();
    if (!sender.Send(phases_[i])) {
      common::ThrowInternalError(
          "ProcessNetwork::Run", "fresh channel rejected a phase value");
    }
    into_senders.push_back(std::move(sender));
    into_receivers.push_back(std::move(receiver));
  }
  auto [observer_sender, observer_receiver] = MakeChannel();

  ChannelSender feed = std::move(into_senders[0]);
  if (!feed.Send(initial_signal_)) {
    common::ThrowInternalError(
        "ProcessNetwork::Run", "fresh channel rejected the initial signal");
  }
  if (topology_ == Topology::kChain) {
    feed.Close();
  }

  std::vector<EngineReport> reports(count);
  std::vector<std::jthread> members;
  members.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    reports[i].index = i;
    reports[i].phase = phases_[i];
    ChannelSender outbound = i + 1 < count ? std::move(into_senders[i + 1])
                                           : std::move(observer_sender);
    members.emplace_back(
        RunMember, images_[i], std::move(into_receivers[i]),
        std::move(outbound), std::ref(reports[i]));
  }

  // Observer: read one value, forward it, repeat. Strictly sequential.
  NetworkOutcome outcome;
  while (auto value = observer_receiver.Receive()) {
    outcome.observed.push_back(*value);
    if (topology_ == Topology::kRing && feed.IsOpen() && !feed.Send(*value)) {
      spdlog::debug("first engine has gone; not forwarding {}", *value);
      feed.Close();
    }
  }
  feed.Close();
  observer_receiver.Close();

  // Joins every member before the reports are read.
  members.clear();

  for (auto& report : reports) {
    if (report.failure) {
      return std::unexpected(
          std::move(*report.failure)
              .WithNote(
                  fmt::format(
                      "in engine {} (phase {})", report.index, report.phase)));
    }
  }
  if (outcome.observed.empty()) {
    return std::unexpected(
        Diagnostic::HostError("process network produced no output"));
  }
  outcome.final_signal = outcome.observed.back();
  outcome.engines = std::move(reports);
  return outcome;
}

auto ToString(Topology topology) -> const char* {
  switch (topology) {
    case Topology::kChain:
      return "chain";
    case Topology::kRing:
      return "ring";
  }
  return "unknown";
}

}  // namespace intcode::runtime
