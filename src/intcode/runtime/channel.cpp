#include "intcode/runtime/channel.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "intcode/common/internal_error.hpp"

namespace intcode::runtime {

ChannelSender::~ChannelSender() {
  Close();
}

auto ChannelSender::operator=(ChannelSender&& other) noexcept
    -> ChannelSender& {
  if (this != &other) {
    Close();
    state_ = std::move(other.state_);
  }
  return *this;
}

auto ChannelSender::Send(Word value) -> bool {
  if (state_ == nullptr) {
    common::ThrowInternalError("ChannelSender::Send", "send on closed sender");
  }
  {
    std::lock_guard lock(state_->mutex);
    if (!state_->receiver_open) {
      return false;
    }
    state_->queue.push_back(value);
  }
  state_->ready.notify_one();
  return true;
}

void ChannelSender::Close() {
  if (state_ == nullptr) {
    return;
  }
  {
    std::lock_guard lock(state_->mutex);
    state_->sender_open = false;
  }
  state_->ready.notify_all();
  state_.reset();
}

ChannelReceiver::~ChannelReceiver() {
  Close();
}

auto ChannelReceiver::operator=(ChannelReceiver&& other) noexcept
    -> ChannelReceiver& {
  if (this != &other) {
    Close();
    state_ = std::move(other.state_);
  }
  return *this;
}

auto ChannelReceiver::Receive() -> std::optional<Word> {
  if (state_ == nullptr) {
    common::ThrowInternalError(
        "ChannelReceiver::Receive", "receive on closed receiver");
  }
  std::unique_lock lock(state_->mutex);
  state_->ready.wait(
      lock, [&] { return !state_->queue.empty() || !state_->sender_open; });
  if (state_->queue.empty()) {
    return std::nullopt;
  }
  Word value = state_->queue.front();
  state_->queue.pop_front();
  return value;
}

void ChannelReceiver::Close() {
  if (state_ == nullptr) {
    return;
  }
  {
    std::lock_guard lock(state_->mutex);
    state_->receiver_open = false;
    state_->queue.clear();
  }
  state_.reset();
}

auto MakeChannel() -> std::pair<ChannelSender, ChannelReceiver> {
  auto state = std::make_shared<detail::ChannelState>();
  return {ChannelSender(state), ChannelReceiver(state)};
}

}  // namespace intcode::runtime
