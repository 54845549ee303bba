#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "intcode/vm/io.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::robot {

enum class Color : uint8_t {
  kBlack = 0,
  kWhite = 1,
};

struct Point {
  int64_t x = 0;
  int64_t y = 0;

  auto operator<=>(const Point&) const = default;
};

// Hull-painting robot driven by a program. Inputs report the color under the
// robot; outputs alternate between a color to paint and a turn (0 left,
// 1 right) followed by one step forward. The robot starts at the origin facing
// up, with y growing downwards.
class PaintingRobot : public vm::IoCapability {
 public:
  PaintingRobot() = default;

  auto RequestInput() -> std::optional<Word> override;
  void EmitOutput(Word value) override;

  // Seed a panel before the run (e.g. start on white).
  void SetPanel(Point point, Color color);

  [[nodiscard]] auto ColorAt(Point point) const -> Color;

  // Number of panels painted at least once
  [[nodiscard]] auto PaintedCount() const -> std::size_t {
    return painted_count_;
  }

  [[nodiscard]] auto Position() const -> Point {
    return position_;
  }

  [[nodiscard]] auto Heading() const -> Point {
    return heading_;
  }

  // Plain PBM (P1) over the bounding box of known panels; white is "0",
  // black is "1".
  [[nodiscard]] auto RenderPbm() const -> std::string;

 private:
  enum class Expect : uint8_t { kPaintColor, kTurn };

  struct Panel {
    Color color = Color::kBlack;
    bool painted = false;
  };

  void Turn(Word command);

  std::map<Point, Panel> panels_;
  std::size_t painted_count_ = 0;
  Point position_{};
  Point heading_{.x = 0, .y = -1};
  Expect expect_ = Expect::kPaintColor;
};

}  // namespace intcode::robot
