/**
 * @file ImageDerivedInputFunction.cpp
 * @brief Implementation of the image-derived input function utilities
 */

#include "ImageDerivedInputFunction.h"
#include "../common/PetKineticsExceptions.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

// ITK Headers
#include "itkImageRegionConstIterator.h"
#include "itkImageRegionIterator.h"
#include "itkMultiplyImageFilter.h"

namespace petkinetics {
namespace idif {

namespace {

using FrameList = std::vector<std::vector<double>>;

std::string SizeToString(const Image3DType::SizeType &size) {
  std::stringstream ss;
  ss << "[" << size[0] << ", " << size[1] << ", " << size[2] << "]";
  return ss.str();
}

std::string SpatialSizeToString(const Image4DType::SizeType &size) {
  std::stringstream ss;
  ss << "[" << size[0] << ", " << size[1] << ", " << size[2] << "]";
  return ss.str();
}

void RequireImage(const void *image, const std::string &function) {
  if (!image) {
    throw std::invalid_argument(function + ": null image pointer");
  }
}

size_t NumberOfFrames(const Image4DType *image) {
  return image->GetLargestPossibleRegion().GetSize()[3];
}

size_t NumberOfSpatialVoxels(const Image4DType *image) {
  auto size = image->GetLargestPossibleRegion().GetSize();
  return size[0] * size[1] * size[2];
}

// 3D image with the spatial geometry of a 4D image, zero filled
Image3DType::Pointer CreateSpatialImage(const Image4DType *reference) {
  auto region4d = reference->GetLargestPossibleRegion();

  Image3DType::IndexType start;
  Image3DType::SizeType size;
  Image3DType::SpacingType spacing;
  Image3DType::PointType origin;
  for (unsigned int d = 0; d < 3; ++d) {
    start[d] = region4d.GetIndex()[d];
    size[d] = region4d.GetSize()[d];
    spacing[d] = reference->GetSpacing()[d];
    origin[d] = reference->GetOrigin()[d];
  }

  auto image = Image3DType::New();
  image->SetRegions(Image3DType::RegionType(start, size));
  image->SetSpacing(spacing);
  image->SetOrigin(origin);
  image->Allocate();
  image->FillBuffer(0.0f);
  return image;
}

// Frame-major copy of the voxel values; voxel order matches a 3D region
// iterator over the spatial region
FrameList ExtractFrames(const Image4DType *image) {
  size_t frames = NumberOfFrames(image);
  size_t voxels = NumberOfSpatialVoxels(image);
  FrameList data(frames, std::vector<double>(voxels, 0.0));

  itk::ImageRegionConstIterator<Image4DType> it(
      image, image->GetLargestPossibleRegion());
  size_t position = 0;
  for (it.GoToBegin(); !it.IsAtEnd(); ++it, ++position) {
    data[position / voxels][position % voxels] = it.Get();
  }
  return data;
}

double NanMean(const std::vector<double> &values) {
  double sum = 0.0;
  size_t count = 0;
  for (double value : values) {
    if (!std::isnan(value)) {
      sum += value;
      ++count;
    }
  }
  return count > 0 ? sum / count : std::numeric_limits<double>::quiet_NaN();
}

// Frames with a NaN mean never win
size_t FindBolusFrameInFrames(const FrameList &data, int search_frames) {
  if (search_frames <= 0) {
    throw ConfigurationException("bolus_search_frames",
                                 std::to_string(search_frames),
                                 "positive frame count");
  }

  size_t frames_to_search =
      std::min(static_cast<size_t>(search_frames), data.size());
  if (frames_to_search == 0) {
    throw OutOfBoundsFrameException(0, search_frames - 1, data.size());
  }

  size_t bolus_index = 0;
  double bolus_value = -std::numeric_limits<double>::infinity();
  for (size_t frame = 0; frame < frames_to_search; ++frame) {
    double frame_mean = NanMean(data[frame]);
    if (frame_mean > bolus_value) {
      bolus_value = frame_mean;
      bolus_index = frame;
    }
  }
  return bolus_index;
}

} // namespace

Image3DType::Pointer MakeEarlyMeanImage(const Image4DType *pet_4d_data,
                                        int start_frame, int end_frame) {
  RequireImage(pet_4d_data, "MakeEarlyMeanImage");

  size_t frames = NumberOfFrames(pet_4d_data);
  if (start_frame < 0 || end_frame < start_frame ||
      static_cast<size_t>(end_frame) >= frames) {
    throw OutOfBoundsFrameException(start_frame, end_frame, frames);
  }

  FrameList data = ExtractFrames(pet_4d_data);
  auto early_mean = CreateSpatialImage(pet_4d_data);
  double frame_count = static_cast<double>(end_frame - start_frame + 1);

  itk::ImageRegionIterator<Image3DType> out(
      early_mean, early_mean->GetLargestPossibleRegion());
  size_t voxel = 0;
  for (out.GoToBegin(); !out.IsAtEnd(); ++out, ++voxel) {
    double sum = 0.0;
    for (int frame = start_frame; frame <= end_frame; ++frame) {
      sum += data[frame][voxel];
    }
    out.Set(static_cast<PixelType>(sum / frame_count));
  }

  return early_mean;
}

Image3DType::Pointer
CropByInputFunctionMask(const Image3DType *early_mean_data,
                        const Image3DType *carotid_mask_data) {
  RequireImage(early_mean_data, "CropByInputFunctionMask");
  RequireImage(carotid_mask_data, "CropByInputFunctionMask");

  auto image_size = early_mean_data->GetLargestPossibleRegion().GetSize();
  auto mask_size = carotid_mask_data->GetLargestPossibleRegion().GetSize();
  if (image_size != mask_size) {
    throw ShapeMismatchException("CropByInputFunctionMask",
                                 "image " + SizeToString(image_size),
                                 "mask " + SizeToString(mask_size),
                                 "ImageDerivedInputFunction");
  }

  auto multiply =
      itk::MultiplyImageFilter<Image3DType, Image3DType, Image3DType>::New();
  multiply->SetInput1(early_mean_data);
  multiply->SetInput2(carotid_mask_data);
  multiply->Update();

  Image3DType::Pointer masked = multiply->GetOutput();
  masked->DisconnectPipeline();
  return masked;
}

Image3DType::Pointer MakeThresholdBinaryMask(const Image3DType *masked_data,
                                             double threshold) {
  RequireImage(masked_data, "MakeThresholdBinaryMask");

  auto mask = Image3DType::New();
  mask->CopyInformation(masked_data);
  mask->SetRegions(masked_data->GetLargestPossibleRegion());
  mask->Allocate();

  itk::ImageRegionConstIterator<Image3DType> in_it(
      masked_data, masked_data->GetLargestPossibleRegion());
  itk::ImageRegionIterator<Image3DType> out_it(
      mask, mask->GetLargestPossibleRegion());

  for (in_it.GoToBegin(), out_it.GoToBegin(); !out_it.IsAtEnd();
       ++in_it, ++out_it) {
    out_it.Set(in_it.Get() < threshold ? 0.0f : 1.0f);
  }

  return mask;
}

Image4DType::Pointer
ApplyThresholdBinaryMaskTo4D(const Image4DType *pet_4d_data,
                             const Image3DType *threshold_binary_data) {
  RequireImage(pet_4d_data, "ApplyThresholdBinaryMaskTo4D");
  RequireImage(threshold_binary_data, "ApplyThresholdBinaryMaskTo4D");

  auto pet_size = pet_4d_data->GetLargestPossibleRegion().GetSize();
  auto mask_size = threshold_binary_data->GetLargestPossibleRegion().GetSize();
  for (unsigned int d = 0; d < 3; ++d) {
    if (pet_size[d] != mask_size[d]) {
      throw ShapeMismatchException("ApplyThresholdBinaryMaskTo4D",
                                   "frame " + SpatialSizeToString(pet_size),
                                   "mask " + SizeToString(mask_size),
                                   "ImageDerivedInputFunction");
    }
  }

  // Flatten the mask once in spatial iteration order
  std::vector<PixelType> mask_values;
  mask_values.reserve(NumberOfSpatialVoxels(pet_4d_data));
  itk::ImageRegionConstIterator<Image3DType> mask_it(
      threshold_binary_data, threshold_binary_data->GetLargestPossibleRegion());
  for (mask_it.GoToBegin(); !mask_it.IsAtEnd(); ++mask_it) {
    mask_values.push_back(mask_it.Get());
  }

  auto masked_4d = Image4DType::New();
  masked_4d->CopyInformation(pet_4d_data);
  masked_4d->SetRegions(pet_4d_data->GetLargestPossibleRegion());
  masked_4d->Allocate();

  itk::ImageRegionConstIterator<Image4DType> in_it(
      pet_4d_data, pet_4d_data->GetLargestPossibleRegion());
  itk::ImageRegionIterator<Image4DType> out_it(
      masked_4d, masked_4d->GetLargestPossibleRegion());

  size_t position = 0;
  for (in_it.GoToBegin(), out_it.GoToBegin(); !out_it.IsAtEnd();
       ++in_it, ++out_it, ++position) {
    out_it.Set(in_it.Get() * mask_values[position % mask_values.size()]);
  }

  return masked_4d;
}

std::vector<double>
AverageMasked4DIntoTac(const Image4DType *masked_4d_pet_data) {
  RequireImage(masked_4d_pet_data, "AverageMasked4DIntoTac");

  size_t voxels = NumberOfSpatialVoxels(masked_4d_pet_data);
  std::vector<double> frame_averages(NumberOfFrames(masked_4d_pet_data), 0.0);
  if (voxels == 0) {
    return frame_averages;
  }

  itk::ImageRegionConstIterator<Image4DType> it(
      masked_4d_pet_data, masked_4d_pet_data->GetLargestPossibleRegion());
  size_t position = 0;
  for (it.GoToBegin(); !it.IsAtEnd(); ++it, ++position) {
    frame_averages[position / voxels] += it.Get();
  }

  for (auto &average : frame_averages) {
    average /= static_cast<double>(voxels);
  }
  return frame_averages;
}

std::vector<double>
GetFrameTimeMidpoints(const std::vector<double> &frame_start_times,
                      const std::vector<double> &frame_duration_times) {
  if (frame_start_times.size() != frame_duration_times.size()) {
    throw ShapeMismatchException("GetFrameTimeMidpoints",
                                 frame_start_times.size(),
                                 frame_duration_times.size());
  }

  std::vector<double> midpoints(frame_start_times.size());
  for (size_t i = 0; i < midpoints.size(); ++i) {
    midpoints[i] =
        std::trunc(frame_start_times[i] + frame_duration_times[i] / 2.0);
  }
  return midpoints;
}

size_t FindBolusFrame(const Image4DType *pet_4d_data, int search_frames) {
  RequireImage(pet_4d_data, "FindBolusFrame");
  return FindBolusFrameInFrames(ExtractFrames(pet_4d_data), search_frames);
}

double NanPercentile(std::vector<double> values, double percentile) {
  if (!(percentile >= 0.0 && percentile <= 100.0)) {
    std::stringstream value;
    value << percentile;
    throw ConfigurationException("percentile", value.str(), "0 to 100");
  }

  values.erase(std::remove_if(values.begin(), values.end(),
                              [](double v) { return std::isnan(v); }),
               values.end());
  if (values.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  std::sort(values.begin(), values.end());

  double rank = percentile / 100.0 * static_cast<double>(values.size() - 1);
  size_t lower = static_cast<size_t>(std::floor(rank));
  size_t upper = static_cast<size_t>(std::ceil(rank));
  double fraction = rank - static_cast<double>(lower);

  if (lower == upper) {
    return values[lower];
  }
  return values[lower] + (values[upper] - values[lower]) * fraction;
}

TimeActivityCurve
GetIdifFromNecktangle(const Image4DType *necktangle_data, double percentile,
                      const std::vector<double> &frame_midpoint_times,
                      const IdifParameters &params) {
  RequireImage(necktangle_data, "GetIdifFromNecktangle");

  if (!(percentile >= 0.0 && percentile <= 100.0)) {
    std::stringstream value;
    value << percentile;
    throw ConfigurationException("percentile", value.str(), "0 to 100");
  }
  if (!(params.automatic_mask_percentile >= 0.0 &&
        params.automatic_mask_percentile <= 100.0)) {
    std::stringstream value;
    value << params.automatic_mask_percentile;
    throw ConfigurationException("automatic_mask_percentile", value.str(),
                                 "0 to 100");
  }
  if (params.bolus_half_window < 0) {
    throw ConfigurationException("bolus_half_window",
                                 std::to_string(params.bolus_half_window),
                                 "non-negative frame count");
  }

  size_t frames = NumberOfFrames(necktangle_data);
  if (frame_midpoint_times.size() != frames) {
    throw ShapeMismatchException("GetIdifFromNecktangle",
                                 "midpoint times " +
                                     std::to_string(frame_midpoint_times.size()),
                                 "frames " + std::to_string(frames),
                                 "ImageDerivedInputFunction");
  }

  FrameList data = ExtractFrames(necktangle_data);
  size_t bolus_index =
      FindBolusFrameInFrames(data, params.bolus_search_frames);
  size_t half_window = static_cast<size_t>(params.bolus_half_window);
  size_t window_start = bolus_index > half_window ? bolus_index - half_window : 0;
  size_t window_end = std::min(bolus_index + half_window, frames - 1);

  if (params.verbose) {
    std::cout << "Bolus frame: " << bolus_index << " (window " << window_start
              << "-" << window_end << ")" << std::endl;
  }

  size_t voxels = NumberOfSpatialVoxels(necktangle_data);

  std::vector<double> bolus_window_average(voxels);
  std::vector<double> voxel_series;
  for (size_t voxel = 0; voxel < voxels; ++voxel) {
    voxel_series.clear();
    for (size_t frame = window_start; frame <= window_end; ++frame) {
      voxel_series.push_back(data[frame][voxel]);
    }
    bolus_window_average[voxel] = NanMean(voxel_series);
  }

  double automatic_threshold_value =
      NanPercentile(bolus_window_average, params.automatic_mask_percentile);

  // NaN averages compare false and stay outside the mask
  std::vector<size_t> carotid_voxels;
  for (size_t voxel = 0; voxel < voxels; ++voxel) {
    if (bolus_window_average[voxel] > automatic_threshold_value) {
      carotid_voxels.push_back(voxel);
    }
  }

  if (params.verbose) {
    std::cout << "Automatic threshold: " << automatic_threshold_value << "; "
              << carotid_voxels.size() << " carotid voxels" << std::endl;
  }
  if (carotid_voxels.empty()) {
    std::cerr << "Warning: no voxels above the automatic threshold; IDIF "
                 "values will be NaN"
              << std::endl;
  }

  TimeActivityCurve tac;
  tac.times = frame_midpoint_times;
  tac.values.resize(frames);

  std::vector<double> masked_frame;
  for (size_t frame = 0; frame < frames; ++frame) {
    masked_frame.clear();
    for (size_t voxel : carotid_voxels) {
      masked_frame.push_back(data[frame][voxel]);
    }
    tac.values[frame] = NanPercentile(masked_frame, percentile);
  }

  return tac;
}

} // namespace idif
} // namespace petkinetics
