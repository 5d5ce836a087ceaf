/**
 * @file ArrayIO.hpp
 * @brief Load and save the 2D real-valued phase and quality fields
 */

#ifndef PHASECLOUD_IO_ARRAY_IO_HPP
#define PHASECLOUD_IO_ARRAY_IO_HPP

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace phasecloud {
namespace io {

/**
 * @brief Array file reader/writer
 *
 * Every loader returns a single-channel CV_64F matrix indexed (row, column).
 * Supported inputs:
 * - NumPy .npy (format 1.0/2.0/3.0, 2-D, numeric or bool dtype, either byte
 *   order, C or Fortran layout)
 * - OpenCV FileStorage documents (.yml, .yaml, .xml, .json)
 * - single-channel rasters readable by cv::imread (.tif, .tiff, .exr, .png, .pfm)
 */
class ArrayIO {
public:
    /**
     * @brief Load an array, choosing the reader from the file extension
     * @throws InputException (FILE_NOT_FOUND, FILE_IO or UNSUPPORTED_FORMAT)
     */
    static cv::Mat load(const std::string& path);

    static cv::Mat loadNpy(const std::string& path);

    /**
     * @brief Decode an in-memory .npy image
     * @param bytes Complete file content
     * @param source Name used in error messages
     */
    static cv::Mat decodeNpy(const std::vector<char>& bytes, const std::string& source);

    static cv::Mat loadFileStorage(const std::string& path);

    static cv::Mat loadImage(const std::string& path);

    /**
     * @brief Write a single-channel matrix as a little-endian float64 .npy (format 1.0)
     * @throws core::Exception (ERROR_FILE_IO) on write failure
     */
    static void saveNpy(const std::string& path, const cv::Mat& array);
};

} // namespace io
} // namespace phasecloud

#endif // PHASECLOUD_IO_ARRAY_IO_HPP
