#pragma once

#include "PapercutTypes.hpp"
#include <opencv2/core.hpp>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace Papercut {

// PresentationML package with one slide per layout page. Each placement
// becomes a group of a background rectangle and a freeform holding the
// clipped contours as subpaths.
class PptxWriter {
public:
    static std::vector<unsigned char> build(const StencilGeometry& geometry, const PanelLayout& layout,
                                            const cv::Scalar& background);

    static std::string slideXml(const StencilGeometry& geometry, const PanelLayout& layout, int page,
                                const cv::Scalar& background);

    static int64_t toEmu(double mm) { return static_cast<int64_t>(std::llround(mm * EMU_PER_MM)); }

    static constexpr double EMU_PER_MM = 36000.0;

private:
    static std::string contentTypes(int slideCount);
    static std::string presentationXml(const PanelLayout& layout, int slideCount);
    static std::string presentationRels(int slideCount);
    static std::string slideMasterXml();
    static std::string slideLayoutXml();
    static std::string themeXml();
    static std::string groupXml(const std::vector<VectorContour>& contours, const Placement& placement,
                                const cv::Scalar& background, int& nextId);
};

} // namespace Papercut
