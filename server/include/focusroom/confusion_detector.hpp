/*
 * 설명: 표정 프레임의 눈썹 계열 신호로 혼란 여부를 판정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/confusion_detector_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace focusroom {

struct ConfusionReading {
  bool confused{false};
  std::optional<std::string> signal;
  double peak{0.0};
  std::size_t skipped{0};
};

class ConfusionDetector {
 public:
  static constexpr double kDefaultThreshold = 0.45;

  explicit ConfusionDetector(double threshold = kDefaultThreshold) : threshold_(threshold) {}

  ConfusionReading Evaluate(const nlohmann::json& frame) const;
  double Threshold() const { return threshold_; }

 private:
  static bool IsBrowSignal(std::string_view name);
  static std::optional<double> ToIntensity(const nlohmann::json& value);

  double threshold_;
};

}  // namespace focusroom
