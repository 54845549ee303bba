#include "intcode/robot/painting_robot.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include <fmt/core.h>

#include "intcode/common/diagnostic.hpp"

namespace intcode::robot {

auto PaintingRobot::RequestInput() -> std::optional<Word> {
  return static_cast<Word>(ColorAt(position_));
}

void PaintingRobot::EmitOutput(Word value) {
  switch (expect_) {
    case Expect::kPaintColor: {
      if (value != 0 && value != 1) {
        throw DiagnosticException(
            Diagnostic::HostError(
                fmt::format("robot cannot paint color {}", value)));
      }
      auto& panel = panels_[position_];
      if (!panel.painted) {
        panel.painted = true;
        ++painted_count_;
      }
      panel.color = static_cast<Color>(value);
      expect_ = Expect::kTurn;
      return;
    }
    case Expect::kTurn:
      Turn(value);
      position_.x += heading_.x;
      position_.y += heading_.y;
      expect_ = Expect::kPaintColor;
      return;
  }
}

void PaintingRobot::Turn(Word command) {
  // Screen coordinates: y grows downwards.
  switch (command) {
    case 0:
      heading_ = Point{.x = heading_.y, .y = -heading_.x};
      return;
    case 1:
      heading_ = Point{.x = -heading_.y, .y = heading_.x};
      return;
    default:
      throw DiagnosticException(
          Diagnostic::HostError(
              fmt::format("robot received unknown turn command {}", command)));
  }
}

void PaintingRobot::SetPanel(Point point, Color color) {
  panels_[point].color = color;
}

auto PaintingRobot::ColorAt(Point point) const -> Color {
  auto it = panels_.find(point);
  return it == panels_.end() ? Color::kBlack : it->second.color;
}

auto PaintingRobot::RenderPbm() const -> std::string {
  if (panels_.empty()) {
    return "P1\n0 0\n";
  }

  int64_t x_min = panels_.begin()->first.x;
  int64_t x_max = x_min;
  int64_t y_min = panels_.begin()->first.y;
  int64_t y_max = y_min;
  for (const auto& [point, panel] : panels_) {
    x_min = std::min(x_min, point.x);
    x_max = std::max(x_max, point.x);
    y_min = std::min(y_min, point.y);
    y_max = std::max(y_max, point.y);
  }

  std::string out = fmt::format(
      "P1\n{} {}\n", x_max - x_min + 1, y_max - y_min + 1);
  for (int64_t y = y_min; y <= y_max; ++y) {
    for (int64_t x = x_min; x <= x_max; ++x) {
      out += ColorAt(Point{.x = x, .y = y}) == Color::kWhite ? '0' : '1';
    }
    out += '\n';
  }
  return out;
}

}  // namespace intcode::robot
