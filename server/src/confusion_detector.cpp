/*
 * 설명: 눈썹 계열 블렌드셰이프 강도를 검사해 혼란 신호를 산출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/confusion_detector_test.cpp
 */
#include "focusroom/confusion_detector.hpp"

#include <cctype>
#include <cmath>

namespace focusroom {

ConfusionReading ConfusionDetector::Evaluate(const nlohmann::json& frame) const {
  ConfusionReading reading;
  if (!frame.is_object()) {
    return reading;
  }
  bool seen = false;
  for (auto it = frame.begin(); it != frame.end(); ++it) {
    if (!IsBrowSignal(it.key())) {
      continue;
    }
    auto intensity = ToIntensity(it.value());
    if (!intensity) {
      ++reading.skipped;
      continue;
    }
    if (!seen || *intensity > reading.peak) {
      reading.peak = *intensity;
      reading.signal = it.key();
      seen = true;
    }
  }
  reading.confused = seen && reading.peak >= threshold_;
  return reading;
}

bool ConfusionDetector::IsBrowSignal(std::string_view name) {
  constexpr std::string_view kPrefix = "brow";
  if (name.size() < kPrefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < kPrefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(name[i])) != kPrefix[i]) {
      return false;
    }
  }
  return true;
}

std::optional<double> ConfusionDetector::ToIntensity(const nlohmann::json& value) {
  double parsed = 0.0;
  if (value.is_number()) {
    parsed = value.get<double>();
  } else if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    try {
      std::size_t idx = 0;
      parsed = std::stod(text, &idx);
      if (idx != text.size()) {
        return std::nullopt;
      }
    } catch (const std::exception&) {
      return std::nullopt;
    }
  } else {
    return std::nullopt;
  }
  if (!std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace focusroom
