#include "intcode/runtime/channel_io.hpp"

#include <optional>

#include <spdlog/spdlog.h>

namespace intcode::runtime {

auto ChannelIo::RequestInput() -> std::optional<Word> {
  if (!inbound_.IsOpen()) {
    return std::nullopt;
  }
  return inbound_.Receive();
}

void ChannelIo::EmitOutput(Word value) {
  if (!outbound_.IsOpen() || !outbound_.Send(value)) {
    ++dropped_outputs_;
    spdlog::debug("output {} dropped: consumer has gone", value);
  }
}

void ChannelIo::Close() {
  inbound_.Close();
  outbound_.Close();
}

}  // namespace intcode::runtime
