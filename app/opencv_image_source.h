/*---------------------------------------------------------*/
/*                                                         */
/*   opencv_image_source.h - OpenCV engine ("opencv")      */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef OPENCV_IMAGE_SOURCE_H
#define OPENCV_IMAGE_SOURCE_H

#include <opencv2/core.hpp>

#include <string>

class OpenCvImageSource {
public:
    // imdecode + INTER_AREA resize. Throws DecodeFailure / ResizeFailure.
    OpenCvImageSource(const std::string& bytes, int width);

    int width() const { return mat.cols; }
    int height() const { return mat.rows; }

    // "#rrggbb", alpha ignored.
    std::string colorAt(int x, int y) const;

    int sourceWidth() const { return srcW; }
    int sourceHeight() const { return srcH; }

private:
    cv::Mat mat; // CV_8UC4, BGRA
    int srcW = 0, srcH = 0;
};

#endif // OPENCV_IMAGE_SOURCE_H
