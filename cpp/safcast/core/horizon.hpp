#pragma once
/*
================================================================================
Fragment 1.3 - Core: Analysis Horizon
FILE: cpp/safcast/core/horizon.hpp

The model is defined on one fixed, contiguous yearly axis. Every series and
result table carries exactly kYears entries, index 0 = kStartYear.
================================================================================
*/

#include <array>
#include <cstddef>

namespace safcast::horizon {

inline constexpr int kStartYear = 2025;
inline constexpr int kEndYear   = 2050;
inline constexpr std::size_t kYears = static_cast<std::size_t>(kEndYear - kStartYear + 1);

constexpr bool contains(int year) noexcept {
  return year >= kStartYear && year <= kEndYear;
}

// Years elapsed since kStartYear. Caller guarantees contains(year).
constexpr std::size_t offset(int year) noexcept {
  return static_cast<std::size_t>(year - kStartYear);
}

constexpr int year_at(std::size_t i) noexcept {
  return kStartYear + static_cast<int>(i);
}

}  // namespace safcast::horizon

namespace safcast {

// One value per horizon year.
using YearArray = std::array<double, horizon::kYears>;

}  // namespace safcast
