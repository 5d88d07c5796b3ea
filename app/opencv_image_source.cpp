/*---------------------------------------------------------*/
/*                                                         */
/*   opencv_image_source.cpp - OpenCV engine ("opencv")    */
/*                                                         */
/*---------------------------------------------------------*/

#include "opencv_image_source.h"
#include "color_math.h"
#include "halfblock_errors.h"
#include "image_source.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <stdexcept>
#include <vector>

OpenCvImageSource::OpenCvImageSource(const std::string& bytes, int width)
{
    if (detectRasterFormat(bytes) == RasterFormat::Unknown)
        throw DecodeFailure("Unsupported image type (GIF, PNG or JPEG expected).");

    std::vector<uchar> buf(bytes.begin(), bytes.end());
    cv::Mat decoded;
    try {
        decoded = cv::imdecode(buf, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeFailure(std::string("Unable to create image (") + e.what() + ").");
    }
    if (decoded.empty())
        throw DecodeFailure("Unable to create image.");

    // 16-bit PNGs come back as CV_16U; scale down before channel conversion.
    if (decoded.depth() == CV_16U)
        decoded.convertTo(decoded, CV_8U, 1.0 / 257.0);

    cv::Mat bgra;
    switch (decoded.channels()) {
        case 1: cv::cvtColor(decoded, bgra, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(decoded, bgra, cv::COLOR_BGR2BGRA); break;
        case 4: bgra = decoded; break;
        default:
            throw DecodeFailure("Unsupported channel count " + std::to_string(decoded.channels()) + ".");
    }

    srcW = bgra.cols;
    srcH = bgra.rows;
    int height = resizedHeight(srcW, srcH, width);

    try {
        cv::resize(bgra, mat, cv::Size(width, height), 0, 0, cv::INTER_AREA);
    } catch (const cv::Exception& e) {
        throw ResizeFailure(std::string("Unable to resize given image (") + e.what() + ").");
    }
    if (mat.cols != width || mat.rows != height)
        throw ResizeFailure("Unable to resize given image.");
}

std::string OpenCvImageSource::colorAt(int x, int y) const
{
    if (x < 0 || y < 0 || x >= mat.cols || y >= mat.rows)
        throw std::out_of_range("Unable to get pixel from image.");
    const cv::Vec4b& px = mat.at<cv::Vec4b>(y, x);
    return ColorMath::bgraToHex(px[0], px[1], px[2]);
}
