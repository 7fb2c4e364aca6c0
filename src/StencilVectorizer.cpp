#include "StencilVectorizer.hpp"
#include "PapercutErrors.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace cv;
using namespace std;

namespace Papercut {

namespace {

// Lattice directions, y down: east, south, west, north.
// Turning right is (d + 1) % 4.
const int DX[4] = {1, 0, -1, 0};
const int DY[4] = {0, 1, 0, -1};

const double DENSIFY_STEP = 0.5;

} // namespace

double VectorContour::signedArea() const {
    return StencilVectorizer::signedArea(points);
}

double VectorContour::area() const {
    return std::abs(signedArea());
}

size_t StencilGeometry::outerCount() const {
    return static_cast<size_t>(count_if(contours.begin(), contours.end(),
        [](const VectorContour& c) { return c.role == ContourRole::Outer; }));
}

size_t StencilGeometry::holeCount() const {
    return contours.size() - outerCount();
}

vector<vector<Point>> StencilVectorizer::traceBoundaries(const Mat& mask) {
    CV_Assert(mask.type() == CV_8UC1);

    const int w = mask.cols;
    const int h = mask.rows;
    const int stride = w + 1;

    auto material = [&](int x, int y) {
        return x >= 0 && y >= 0 && x < w && y < h && mask.at<uchar>(y, x) != 0;
    };

    // Outgoing edge bits per lattice vertex, material on the right-hand side
    vector<uint8_t> out(static_cast<size_t>(stride) * (h + 1), 0);
    auto addEdge = [&](int x, int y, int dir) {
        out[static_cast<size_t>(y) * stride + x] |= static_cast<uint8_t>(1u << dir);
    };

    for (int y = 0; y < h; y++) {
        const uchar* row = mask.ptr<uchar>(y);
        for (int x = 0; x < w; x++) {
            if (!row[x]) continue;
            if (!material(x, y - 1)) addEdge(x, y, 0);         // top, eastward
            if (!material(x + 1, y)) addEdge(x + 1, y, 1);     // right, southward
            if (!material(x, y + 1)) addEdge(x + 1, y + 1, 2); // bottom, westward
            if (!material(x - 1, y)) addEdge(x, y + 1, 3);     // left, northward
        }
    }

    vector<vector<Point>> loops;
    vector<uint8_t> used(out.size(), 0);

    for (int vy = 0; vy <= h; vy++) {
        for (int vx = 0; vx <= w; vx++) {
            size_t startIdx = static_cast<size_t>(vy) * stride + vx;
            for (int startDir = 0; startDir < 4; startDir++) {
                uint8_t bit = static_cast<uint8_t>(1u << startDir);
                if (!(out[startIdx] & bit) || (used[startIdx] & bit)) continue;

                vector<Point> loop;
                int x = vx, y = vy, dir = startDir;
                while (true) {
                    size_t idx = static_cast<size_t>(y) * stride + x;
                    used[idx] |= static_cast<uint8_t>(1u << dir);
                    loop.emplace_back(x, y);
                    x += DX[dir];
                    y += DY[dir];

                    // Successor edge: right turn first, then straight, then left
                    size_t next = static_cast<size_t>(y) * stride + x;
                    int candidates[3] = {(dir + 1) % 4, dir, (dir + 3) % 4};
                    int chosen = -1;
                    for (int c : candidates) {
                        if (out[next] & (1u << c)) {
                            chosen = c;
                            break;
                        }
                    }
                    CV_Assert(chosen >= 0);
                    if (x == vx && y == vy && chosen == startDir) break;
                    dir = chosen;
                }
                loops.push_back(std::move(loop));
            }
        }
    }
    return loops;
}

vector<Point> StencilVectorizer::removeCollinear(const vector<Point>& loop) {
    const size_t n = loop.size();
    if (n < 3) return loop;

    vector<Point> corners;
    corners.reserve(n / 2);
    for (size_t i = 0; i < n; i++) {
        const Point& prev = loop[(i + n - 1) % n];
        const Point& curr = loop[i];
        const Point& next = loop[(i + 1) % n];
        Point d1 = curr - prev;
        Point d2 = next - curr;
        if (d1.x * d2.y - d1.y * d2.x != 0) {
            corners.push_back(curr);
        }
    }
    return corners;
}

double StencilVectorizer::signedArea(const vector<Point2d>& points) {
    const size_t n = points.size();
    if (n < 3) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < n; i++) {
        const Point2d& a = points[i];
        const Point2d& b = points[(i + 1) % n];
        sum += a.x * b.y - b.x * a.y;
    }
    return 0.5 * sum;
}

vector<Point2d> StencilVectorizer::smoothContour(const vector<Point>& corners,
                                                 const VectorizeParams& params) {
    vector<Point2d> lattice;
    lattice.reserve(corners.size());
    for (const Point& p : corners) lattice.emplace_back(p.x, p.y);

    if (params.antialiasRadius <= 0.0 || corners.size() < 3) {
        return lattice;
    }

    // Densify so the kernel sees the boundary at a uniform step
    vector<Point2d> dense;
    const size_t n = lattice.size();
    for (size_t i = 0; i < n; i++) {
        const Point2d& a = lattice[i];
        const Point2d& b = lattice[(i + 1) % n];
        double len = norm(b - a);
        int steps = max(1, static_cast<int>(lround(len / DENSIFY_STEP)));
        for (int s = 0; s < steps; s++) {
            double t = static_cast<double>(s) / steps;
            dense.emplace_back(a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t);
        }
    }

    const double sigma = params.antialiasRadius / DENSIFY_STEP;
    const int half = max(1, static_cast<int>(ceil(3.0 * sigma)));
    vector<double> weights(2 * half + 1);
    double total = 0.0;
    for (int k = -half; k <= half; k++) {
        double wgt = exp(-(k * k) / (2.0 * sigma * sigma));
        weights[k + half] = wgt;
        total += wgt;
    }
    for (double& wgt : weights) wgt /= total;

    const int m = static_cast<int>(dense.size());
    vector<Point2f> smoothed;
    smoothed.reserve(dense.size());
    for (int i = 0; i < m; i++) {
        Point2d acc(0.0, 0.0);
        for (int k = -half; k <= half; k++) {
            int idx = ((i + k) % m + m) % m;
            acc += dense[idx] * weights[k + half];
        }
        // Bounded displacement keeps neighbouring contours from touching.
        // Douglas-Peucker chords add up to simplifyEpsilon on top of the cap.
        Point2d delta = acc - dense[i];
        double dist = norm(delta);
        if (dist > params.maxDisplacement) {
            acc = dense[i] + delta * (params.maxDisplacement / dist);
        }
        smoothed.emplace_back(static_cast<float>(acc.x), static_cast<float>(acc.y));
    }

    vector<Point2f> simplified;
    if (params.simplifyEpsilon > 0.0) {
        approxPolyDP(smoothed, simplified, params.simplifyEpsilon, true);
    } else {
        simplified = smoothed;
    }

    vector<Point2d> result;
    result.reserve(simplified.size());
    for (const Point2f& p : simplified) result.emplace_back(p.x, p.y);
    return result;
}

void StencilVectorizer::assignRoles(vector<VectorContour>& contours) {
    for (auto& contour : contours) {
        contour.role = contour.signedArea() >= 0.0 ? ContourRole::Outer : ContourRole::Hole;
        contour.parent = -1;
    }

    vector<vector<Point2f>> outerPolys(contours.size());
    for (size_t i = 0; i < contours.size(); i++) {
        if (contours[i].role != ContourRole::Outer) continue;
        for (const auto& p : contours[i].points) {
            outerPolys[i].emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
        }
    }

    for (size_t h = 0; h < contours.size(); h++) {
        auto& hole = contours[h];
        if (hole.role != ContourRole::Hole || hole.points.empty()) continue;

        Point2f sample(static_cast<float>(hole.points.front().x),
                       static_cast<float>(hole.points.front().y));
        double bestArea = 0.0;
        for (size_t o = 0; o < contours.size(); o++) {
            if (contours[o].role != ContourRole::Outer) continue;
            if (pointPolygonTest(outerPolys[o], sample, false) <= 0) continue;
            double area = contours[o].area();
            if (hole.parent < 0 || area < bestArea) {
                hole.parent = static_cast<int>(o);
                bestArea = area;
            }
        }
    }
}

StencilGeometry StencilVectorizer::vectorize(const StencilMask& mask, const VectorizeParams& params,
                                             DebugImageStack* debug, bool verbose) {
    if (mask.mask.empty()) {
        throw DegenerateGeometryError("Cannot vectorize an empty mask");
    }

    cout << "[INFO] Tracing stencil boundaries" << endl;
    vector<vector<Point>> loops = traceBoundaries(mask.mask);
    if (verbose) {
        cout << "[DEBUG] Traced " << loops.size() << " boundary loops" << endl;
    }

    StencilGeometry geometry;
    geometry.sourceSize = mask.mask.size();

    size_t dropped = 0;
    for (size_t i = 0; i < loops.size(); i++) {
        vector<Point> corners = removeCollinear(loops[i]);
        if (corners.size() < 3) {
            throw DegenerateGeometryError("Boundary loop " + to_string(i) + " has fewer than 3 corners");
        }

        if (params.minRegionPx > 0.0) {
            vector<Point2d> lattice(corners.begin(), corners.end());
            if (std::abs(signedArea(lattice)) < params.minRegionPx) {
                dropped++;
                continue;
            }
        }

        VectorContour contour;
        contour.points = smoothContour(corners, params);
        if (contour.points.size() < 3) {
            throw DegenerateGeometryError("Contour " + to_string(i) + " collapsed to " +
                                          to_string(contour.points.size()) +
                                          " points with antialias radius " +
                                          to_string(params.antialiasRadius));
        }
        geometry.contours.push_back(std::move(contour));
    }

    if (geometry.contours.empty()) {
        throw DegenerateGeometryError("No contours left after filtering (" + to_string(dropped) + " dropped)");
    }

    assignRoles(geometry.contours);

    if (debug) debug->pushContours(mask.mask, geometry.contours, "contours");

    cout << "[INFO] Vectorized " << geometry.contours.size() << " contours ("
         << geometry.outerCount() << " outer, " << geometry.holeCount() << " holes)";
    if (dropped > 0) cout << ", dropped " << dropped << " specks";
    cout << endl;
    return geometry;
}

} // namespace Papercut
