/**
 * @file ImageDerivedInputFunction.h
 * @brief Image-derived input function (IDIF) preparation from 4D PET data
 *
 * Turns a dynamic PET image into the (times, input TAC) pair consumed by the
 * graphical analysis engine: early-frame averaging, carotid mask cropping,
 * threshold masking, frame averaging and bolus-frame/percentile extraction.
 * All operations work on in-memory ITK images; the fourth image axis is the
 * frame (time) index.
 */

#ifndef PETKINETICS_IMAGE_DERIVED_INPUT_FUNCTION_H
#define PETKINETICS_IMAGE_DERIVED_INPUT_FUNCTION_H

#include <string>
#include <vector>

// ITK Core
#include "itkImage.h"

namespace petkinetics {
namespace idif {

using PixelType = float;
using Image3DType = itk::Image<PixelType, 3>;
using Image4DType = itk::Image<PixelType, 4>;

/**
 * @brief Sampled time-activity curve
 */
struct TimeActivityCurve {
  std::vector<double> times;  // Frame mid-point times
  std::vector<double> values; // Activity per frame
};

/**
 * @brief Bolus detection and automatic masking parameters
 */
struct IdifParameters {
  int bolus_search_frames = 10;            // Frames searched for the bolus peak
  int bolus_half_window = 1;               // Frames either side of the peak
  double automatic_mask_percentile = 90.0; // Voxels above this are "carotid"
  bool verbose = false;
};

/**
 * @brief Voxel-wise mean of frames [start_frame, end_frame] (inclusive)
 * @throws OutOfBoundsFrameException if the window is outside the image
 */
Image3DType::Pointer MakeEarlyMeanImage(const Image4DType *pet_4d_data,
                                        int start_frame = 3,
                                        int end_frame = 7);

/**
 * @brief Voxel-wise product of an image and a (binary) mask
 * @throws ShapeMismatchException if the two images differ in size
 * @throws itk::ExceptionObject if they differ in origin, spacing or direction
 */
Image3DType::Pointer CropByInputFunctionMask(const Image3DType *early_mean_data,
                                             const Image3DType *carotid_mask_data);

// 0 where the value is below the threshold, 1 elsewhere
Image3DType::Pointer MakeThresholdBinaryMask(const Image3DType *masked_data,
                                             double threshold);

/**
 * @brief Multiply every frame of a 4D image by a 3D mask
 * @throws ShapeMismatchException if the spatial sizes differ
 */
Image4DType::Pointer
ApplyThresholdBinaryMaskTo4D(const Image4DType *pet_4d_data,
                             const Image3DType *threshold_binary_data);

// Mean of every frame, including zeroed voxels
std::vector<double>
AverageMasked4DIntoTac(const Image4DType *masked_4d_pet_data);

/**
 * @brief Frame mid-point times, truncated toward zero
 * @throws ShapeMismatchException if the inputs differ in length
 */
std::vector<double>
GetFrameTimeMidpoints(const std::vector<double> &frame_start_times,
                      const std::vector<double> &frame_duration_times);

/**
 * @brief Locate the bolus frame: highest NaN-ignoring frame mean among the
 *        first @p search_frames frames
 *
 * Frames whose mean is NaN are never selected.
 */
size_t FindBolusFrame(const Image4DType *pet_4d_data, int search_frames = 10);

/**
 * @brief Percentile of the non-NaN values using linear interpolation
 * @return NaN if every value is NaN (or there are none)
 * @throws ConfigurationException for a percentile outside [0, 100]
 */
double NanPercentile(std::vector<double> values, double percentile);

/**
 * @brief IDIF from a 4D neck image
 *
 * The bolus frame window is averaged voxel-wise, voxels above the automatic
 * percentile of that average form the carotid mask, and each frame's value is
 * the requested percentile of its masked voxels.
 *
 * @throws ShapeMismatchException if the number of mid-point times differs
 *         from the number of frames
 * @throws ConfigurationException for a percentile outside [0, 100]
 */
TimeActivityCurve
GetIdifFromNecktangle(const Image4DType *necktangle_data, double percentile,
                      const std::vector<double> &frame_midpoint_times,
                      const IdifParameters &params = IdifParameters());

} // namespace idif
} // namespace petkinetics

#endif // PETKINETICS_IMAGE_DERIVED_INPUT_FUNCTION_H
