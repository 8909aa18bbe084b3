#include "bags/downsampler.hpp"
#include <algorithm>
#include <cmath>

namespace bags {

std::vector<double> downsample(const std::vector<double>& data, size_t width) {
  if (width == 0 || data.empty()) {
    return {};
  }
  const size_t n = data.size();
  if (n <= width) {
    return data;
  }

  const double bucket = static_cast<double>(n) / static_cast<double>(width);
  std::vector<double> out;
  out.reserve(width);

  for (size_t i = 0; i < width; ++i) {
    const size_t start = static_cast<size_t>(static_cast<double>(i) * bucket);
    const size_t end = std::min(static_cast<size_t>(static_cast<double>(i + 1) * bucket), n);

    if (start >= end) {
      // Truncated boundaries can leave a bucket empty
      if (!out.empty()) out.push_back(out.back());
      continue;
    }

    if (out.empty()) {
      out.push_back(data[end - 1]);
      continue;
    }

    auto [lo, hi] = std::minmax_element(data.begin() + static_cast<std::ptrdiff_t>(start),
                                        data.begin() + static_cast<std::ptrdiff_t>(end));
    const double prev = out.back();
    const double d_min = std::fabs(*lo - prev);
    const double d_max = std::fabs(*hi - prev);
    out.push_back(d_min > d_max ? *lo : *hi);
  }
  return out;
}

std::vector<int> scaleToLevels(const std::vector<double>& values, int resolution) {
  std::vector<int> levels;
  if (values.empty() || resolution <= 0) {
    return levels;
  }
  levels.reserve(values.size());

  auto [lo_it, hi_it] = std::minmax_element(values.begin(), values.end());
  const double lo = *lo_it;
  const double range = *hi_it - lo;

  if (!(range > 0.0) || !std::isfinite(range)) {
    levels.assign(values.size(), resolution / 2);
    return levels;
  }

  for (double v : values) {
    int level = static_cast<int>(std::lround((v - lo) / range * static_cast<double>(resolution - 1)));
    levels.push_back(std::clamp(level, 0, resolution - 1));
  }
  return levels;
}

} // namespace bags
