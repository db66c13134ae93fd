#include "linreg/cv_adapters.hpp"

#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "linreg/debug.hpp"

namespace linreg {

namespace {

template <typename Point>
std::optional<Line<double>> fit_point_set(const std::vector<Point>& points,
                                          const char* name)
{
  std::optional<Line<double>> fit = linear_regression_of<double>(points);
  debug_report_fit(name, points.size(), fit);
  return fit;
}

// Row-major copy as CV_64F. convertTo always allocates a continuous matrix.
cv::Mat to_f64(const cv::Mat& m)
{
  cv::Mat out;
  m.convertTo(out, CV_64F);
  CV_Assert(out.isContinuous());
  return out;
}

} // namespace

std::optional<Line<double>> fit_points(const std::vector<cv::Point>& points)
{
  return fit_point_set(points, "fit_points(Point)");
}

std::optional<Line<double>> fit_points(const std::vector<cv::Point2f>& points)
{
  return fit_point_set(points, "fit_points(Point2f)");
}

std::optional<Line<double>> fit_points(const std::vector<cv::Point2d>& points)
{
  return fit_point_set(points, "fit_points(Point2d)");
}

std::optional<Line<double>> fit_mats(const cv::Mat& xs, const cv::Mat& ys)
{
  CV_Assert(xs.empty() || xs.channels() == 1);
  CV_Assert(ys.empty() || ys.channels() == 1);

  if (xs.total() != ys.total() || xs.empty())
    return std::nullopt;

  const cv::Mat x64 = to_f64(xs);
  const cv::Mat y64 = to_f64(ys);

  const std::size_t n = x64.total();
  const double* x = x64.ptr<double>();
  const double* y = y64.ptr<double>();

  std::optional<Line<double>> fit = linear_regression<double>(x, x + n, y, y + n);
  debug_report_fit("fit_mats", n, fit);
  return fit;
}

ChannelFits fit_channels(const cv::Mat& ref, const cv::Mat& dist)
{
  CV_Assert(ref.size() == dist.size());
  CV_Assert(ref.type() == dist.type());

  const int channels = ref.channels();
  if (ref.empty())
    return ChannelFits(static_cast<std::size_t>(channels));

  ChannelFits fits;
  fits.reserve(static_cast<std::size_t>(channels));

  cv::Mat refCh, distCh;
  for (int c = 0; c < channels; ++c) {
    cv::extractChannel(ref,  refCh,  c);
    cv::extractChannel(dist, distCh, c);
    fits.push_back(fit_mats(refCh, distCh));
  }
  return fits;
}

ChannelFits fit_lab_channels(const cv::Mat& refBGR, const cv::Mat& distBGR)
{
  CV_Assert(refBGR.type()  == CV_8UC3);
  CV_Assert(distBGR.type() == CV_8UC3);
  CV_Assert(refBGR.size()  == distBGR.size());

  cv::Mat refLab, distLab;
  cv::cvtColor(refBGR,  refLab,  cv::COLOR_BGR2Lab);
  cv::cvtColor(distBGR, distLab, cv::COLOR_BGR2Lab);

  cv::Mat refLab32, distLab32;
  refLab.convertTo(refLab32,   CV_32FC3);
  distLab.convertTo(distLab32, CV_32FC3);

  return fit_channels(refLab32, distLab32);
}

ChannelFits fit_channels_from_files(const std::string& refPath,
                                    const std::string& distPath,
                                    ChannelSpace space)
{
  cv::Mat refBGR = cv::imread(refPath, cv::IMREAD_COLOR);
  if (refBGR.empty()) {
    throw std::runtime_error("fit_channels_from_files: failed to read image: " + refPath);
  }
  cv::Mat distBGR = cv::imread(distPath, cv::IMREAD_COLOR);
  if (distBGR.empty()) {
    throw std::runtime_error("fit_channels_from_files: failed to read image: " + distPath);
  }
  if (refBGR.size() != distBGR.size()) {
    throw std::runtime_error("fit_channels_from_files: size mismatch between "
                             + refPath + " and " + distPath);
  }
  if (space == ChannelSpace::Lab)
    return fit_lab_channels(refBGR, distBGR);
  return fit_channels(refBGR, distBGR);
}

} // namespace linreg
