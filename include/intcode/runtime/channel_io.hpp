#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "intcode/runtime/channel.hpp"
#include "intcode/vm/io.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::runtime {

// Binds an engine to an inbound and an outbound channel. Input blocks on the
// inbound channel; output never blocks.
class ChannelIo : public vm::IoCapability {
 public:
  ChannelIo(ChannelReceiver inbound, ChannelSender outbound)
      : inbound_(std::move(inbound)), outbound_(std::move(outbound)) {
  }

  auto RequestInput() -> std::optional<Word> override;
  void EmitOutput(Word value) override;

  // Close both ends so neighbours observe end of stream.
  void Close();

  [[nodiscard]] auto DroppedOutputs() const -> std::size_t {
    return dropped_outputs_;
  }

 private:
  ChannelReceiver inbound_;
  ChannelSender outbound_;
  std::size_t dropped_outputs_ = 0;
};

}  // namespace intcode::runtime
