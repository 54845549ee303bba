#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "intcode/vm/word.hpp"

namespace intcode::runtime {

namespace detail {

// Shared between exactly one sender and one receiver.
struct ChannelState {
  std::mutex mutex;
  std::condition_variable ready;
  std::deque<Word> queue;
  bool sender_open = true;
  bool receiver_open = true;
};

}  // namespace detail

// Producer end of an unbounded FIFO word channel. Closing (explicitly or by
// destruction) lets the receiver drain what was sent and then see end of
// stream.
class ChannelSender {
 public:
  explicit ChannelSender(std::shared_ptr<detail::ChannelState> state)
      : state_(std::move(state)) {
  }
  ~ChannelSender();

  ChannelSender(const ChannelSender&) = delete;
  auto operator=(const ChannelSender&) -> ChannelSender& = delete;
  ChannelSender(ChannelSender&& other) noexcept = default;
  auto operator=(ChannelSender&& other) noexcept -> ChannelSender&;

  // Never blocks. Returns false if the receiver has gone, in which case the
  // value is discarded.
  auto Send(Word value) -> bool;

  void Close();

  [[nodiscard]] auto IsOpen() const -> bool {
    return state_ != nullptr;
  }

 private:
  std::shared_ptr<detail::ChannelState> state_;
};

// Consumer end of a word channel.
class ChannelReceiver {
 public:
  explicit ChannelReceiver(std::shared_ptr<detail::ChannelState> state)
      : state_(std::move(state)) {
  }
  ~ChannelReceiver();

  ChannelReceiver(const ChannelReceiver&) = delete;
  auto operator=(const ChannelReceiver&) -> ChannelReceiver& = delete;
  ChannelReceiver(ChannelReceiver&& other) noexcept = default;
  auto operator=(ChannelReceiver&& other) noexcept -> ChannelReceiver&;

  // Blocks until a value arrives. Returns nullopt once the sender is closed
  // and every value it sent has been received.
  auto Receive() -> std::optional<Word>;

  void Close();

  [[nodiscard]] auto IsOpen() const -> bool {
    return state_ != nullptr;
  }

 private:
  std::shared_ptr<detail::ChannelState> state_;
};

auto MakeChannel() -> std::pair<ChannelSender, ChannelReceiver>;

}  // namespace intcode::runtime
