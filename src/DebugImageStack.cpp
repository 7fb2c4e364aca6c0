#include "DebugImageStack.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdio>
#include <filesystem>
#include <iostream>

using namespace cv;
using namespace std;
namespace fs = std::filesystem;

namespace Papercut {

DebugImageStack::DebugImageStack(string outputPath)
    : m_outputPath(std::move(outputPath)) {
}

void DebugImageStack::push(const Mat& image, const string& name) {
    if (!enabled()) return;
    m_images.emplace_back(image.clone(), name);
}

void DebugImageStack::pushContours(const Mat& image, const vector<VectorContour>& contours,
                                   const string& name) {
    if (!enabled()) return;

    Mat debugImg;
    if (image.channels() == 1) {
        cvtColor(image, debugImg, COLOR_GRAY2BGR);
    } else {
        debugImg = image.clone();
    }

    // Outer contours green, holes red
    for (const auto& contour : contours) {
        vector<Point> pts;
        pts.reserve(contour.points.size());
        for (const auto& p : contour.points) {
            pts.emplace_back(cvRound(p.x), cvRound(p.y));
        }
        Scalar color = contour.role == ContourRole::Outer ? Scalar(0, 255, 0) : Scalar(0, 0, 255);
        polylines(debugImg, vector<vector<Point>>{pts}, true, color, 1);
    }

    m_images.emplace_back(debugImg, name);
}

size_t DebugImageStack::flush() {
    if (!enabled() || m_images.empty()) return 0;

    cout << "[DEBUG] Flushing " << m_images.size() << " debug images..." << endl;

    error_code ec;
    fs::create_directories(m_outputPath, ec);
    if (ec) {
        cerr << "[WARN] Cannot create debug directory " << m_outputPath << ": " << ec.message() << endl;
        m_images.clear();
        return 0;
    }

    size_t written = 0;
    for (size_t i = 0; i < m_images.size(); i++) {
        const auto& [image, name] = m_images[i];

        char indexStr[8];
        snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
        string filename = string(indexStr) + "_" + name + ".png";
        string fullPath = (fs::path(m_outputPath) / filename).string();

        bool success = false;
        try {
            success = imwrite(fullPath, image);
        } catch (const cv::Exception& e) {
            cerr << "[WARN] " << e.what() << endl;
        }
        if (success) {
            cout << "[DEBUG] Saved: " << filename << endl;
            written++;
        } else {
            cout << "[WARN] Failed to save: " << filename << endl;
        }
    }

    m_images.clear();
    return written;
}

} // namespace Papercut
