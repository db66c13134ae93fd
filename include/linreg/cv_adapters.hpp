#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "linreg/line.hpp"
#include "linreg/regression.hpp"

namespace linreg {

template <typename T>
struct PairAccess<cv::Point_<T>> {
  static T x(const cv::Point_<T>& p) { return p.x; }
  static T y(const cv::Point_<T>& p) { return p.y; }
};

template <typename T>
struct PairAccess<cv::Vec<T, 2>> {
  static T x(const cv::Vec<T, 2>& v) { return v[0]; }
  static T y(const cv::Vec<T, 2>& v) { return v[1]; }
};

// One fit per channel; nullopt where that channel has no fit.
using ChannelFits = std::vector<std::optional<Line<double>>>;

// Colour space the channels are fitted in.
enum class ChannelSpace {
  Bgr,
  Lab   // L*, a*, b* as CV_32FC3
};

// Point sets, treated as (x, y) pairs.
std::optional<Line<double>> fit_points(const std::vector<cv::Point>& points);
std::optional<Line<double>> fit_points(const std::vector<cv::Point2f>& points);
std::optional<Line<double>> fit_points(const std::vector<cv::Point2d>& points);

// xs and ys are single-channel matrices of any depth, read in row-major
// order. nullopt if their element counts differ or both are empty.
std::optional<Line<double>> fit_mats(const cv::Mat& xs, const cv::Mat& ys);

// Per-channel fit dist_c = slope * ref_c + intercept.
// ref and dist must have the same size and type.
ChannelFits fit_channels(const cv::Mat& ref, const cv::Mat& dist);

// Converts two CV_8UC3 BGR images to Lab (float) and runs fit_channels.
ChannelFits fit_lab_channels(const cv::Mat& refBGR, const cv::Mat& distBGR);

// Loads both images as BGR and fits them in the given space.
// Throws std::runtime_error if either file cannot be read or the sizes differ.
ChannelFits fit_channels_from_files(const std::string& refPath,
                                    const std::string& distPath,
                                    ChannelSpace space = ChannelSpace::Bgr);

} // namespace linreg
