#pragma once
#include <cstddef>
#include <vector>

namespace bags {

// Reduces a series to at most `width` samples, one per bucket, keeping the
// extreme of each bucket that moves farthest from the previous sample.
// Series that already fit are returned unchanged; width 0 yields nothing.
std::vector<double> downsample(const std::vector<double>& data, size_t width);

// Maps values onto integer levels [0, resolution). A flat series maps every
// value to resolution / 2.
std::vector<int> scaleToLevels(const std::vector<double>& values, int resolution);

} // namespace bags
