/* @file OledFace.cpp
 * @brief face drawing on the 128x64 panel
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// Marich headers
#include "core/Logger.hpp"
#include "io/OLEDDisplay.hpp"
#include "ui/OledFace.hpp"

using namespace marich::ui;
using marich::core::Emotion;
using marich::io::OLEDDisplay;

namespace {

  constexpr int kLeftEyeX = 40;
  constexpr int kRightEyeX = 88;
  constexpr int kEyeY = 24;
  constexpr int kMouthY = 48;

  std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

} // namespace

OledFace::OledFace(io::OLEDDisplay& display) : display_(display) {}

void OledFace::resume() {
  if (visible_)
    return;
  visible_ = true;
  display_.setPower(true);
  redraw();
  marich::core::logging::get("ui")->info("[FACE] resumed");
}

void OledFace::suspend() {
  if (!visible_)
    return;
  visible_ = false;
  talking_ = false;
  display_.clear();
  display_.flush();
  display_.setPower(false);
  marich::core::logging::get("ui")->info("[FACE] suspended");
}

void OledFace::setEmotion(Emotion e) {
  emotion_ = e;
  redraw();
}

void OledFace::startAnimationLoops() {
  if (animating_)
    return;
  animating_ = true;
  nextBlink_ = Clock::now() + kBlinkPeriod;
}

void OledFace::displayGameImage(const std::string& path) {
  gameImage_ = path;
  redraw();
}

void OledFace::clearGameImage() {
  gameImage_.clear();
  redraw();
}

void OledFace::startTalking() {
  talking_ = true;
  mouthPhase_ = 0;
}

void OledFace::stopTalking() {
  talking_ = false;
  redraw();
}

void OledFace::tick(Clock::time_point now) {
  if (!visible_ || !animating_)
    return;

  if (!blinking_ && now >= nextBlink_) {
    blinking_ = true;
    nextBlink_ = now + kBlinkLength;
  } else if (blinking_ && now >= nextBlink_) {
    blinking_ = false;
    nextBlink_ = now + kBlinkPeriod;
  }
  if (talking_)
    mouthPhase_ = (mouthPhase_ + 1) % 4;

  redraw();
}

void OledFace::redraw() {
  if (!visible_)
    return;

  display_.clear();
  if (!gameImage_.empty()) {
    drawGameIcon();
  } else {
    drawEyes(blinking_);
    drawMouth();
  }
  display_.flush();
}

void OledFace::drawEyes(bool closed) {
  const auto e = emotion_.load();

  for (int x : { kLeftEyeX, kRightEyeX }) {
    if (closed) {
      display_.fillRect(x - 10, kEyeY - 1, 21, 3);
      continue;
    }
    switch (e) {
    case Emotion::Happy: // upturned arcs
      display_.fillEllipse(x, kEyeY + 4, 11, 9);
      display_.fillEllipse(x, kEyeY + 8, 11, 9, false);
      break;
    case Emotion::Scared: // wide with pupils
      display_.fillEllipse(x, kEyeY, 12, 14);
      display_.fillEllipse(x, kEyeY, 4, 4, false);
      break;
    case Emotion::Shy:
      display_.fillEllipse(x, kEyeY + 2, 7, 8);
      break;
    case Emotion::Confused:
      display_.fillEllipse(x, kEyeY, x == kLeftEyeX ? 10 : 6, x == kLeftEyeX ? 12 : 7);
      break;
    default:
      display_.fillEllipse(x, kEyeY, 10, 12);
      break;
    }
  }

  if (e == Emotion::Angry && !closed) {
    display_.drawLine(26, 6, 50, 13);
    display_.drawLine(26, 7, 50, 14);
    display_.drawLine(102, 6, 78, 13);
    display_.drawLine(102, 7, 78, 14);
  }
  if (e == Emotion::Shy) {
    display_.fillEllipse(20, 40, 6, 3);
    display_.fillEllipse(108, 40, 6, 3);
  }
}

void OledFace::drawMouth() {
  if (talking_) {
    const int open = 2 + 3 * (mouthPhase_ % 2) + (mouthPhase_ == 2 ? 2 : 0);
    display_.fillEllipse(64, kMouthY, 10, open);
    return;
  }

  switch (emotion_.load()) {
  case Emotion::Happy: // smile: lower half of an ellipse
    display_.fillEllipse(64, kMouthY - 4, 18, 10);
    display_.fillRect(44, kMouthY - 16, 41, 12, false);
    break;
  case Emotion::Angry: // frown
    display_.fillEllipse(64, kMouthY + 6, 16, 8);
    display_.fillRect(46, kMouthY + 4, 37, 12, false);
    break;
  case Emotion::Scared:
    display_.fillEllipse(64, kMouthY, 8, 7);
    break;
  case Emotion::Shy:
    display_.fillRect(58, kMouthY, 13, 2);
    break;
  case Emotion::Confused: // zig-zag
    for (int i = 0; i < 4; ++i)
      display_.drawLine(48 + i * 8, kMouthY + (i % 2 ? 3 : -3), 56 + i * 8, kMouthY + (i % 2 ? -3 : 3));
    break;
  default:
    display_.fillRect(50, kMouthY, 29, 3);
    break;
  }
}

void OledFace::drawGameIcon() {
  const auto name = lower(gameImage_);
  if (name.find("rock") != std::string::npos) {
    display_.fillEllipse(64, 32, 24, 20);
  } else if (name.find("paper") != std::string::npos) {
    display_.fillRect(44, 8, 40, 48);
    for (int y = 16; y < 52; y += 8)
      display_.fillRect(50, y, 28, 2, false);
  } else if (name.find("scissors") != std::string::npos) {
    for (int d = -1; d <= 1; ++d) {
      display_.drawLine(44 + d, 8, 84 + d, 44);
      display_.drawLine(84 + d, 8, 44 + d, 44);
    }
    display_.fillEllipse(40, 50, 7, 7);
    display_.fillEllipse(40, 50, 3, 3, false);
    display_.fillEllipse(88, 50, 7, 7);
    display_.fillEllipse(88, 50, 3, 3, false);
  } else {
    display_.fillRect(20, 8, 88, 2);
    display_.fillRect(20, 54, 88, 2);
    display_.fillRect(20, 8, 2, 48);
    display_.fillRect(106, 8, 2, 48);
  }
}
