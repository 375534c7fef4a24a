#ifndef LENSMAP_PIXELSTRIANGLES_H
#define LENSMAP_PIXELSTRIANGLES_H
/*LibLensmap, or the Lens Displacement Map Library, is a collection of utilities to pre-compute camera lens distortions.

Copyright (C) 2024  Paragon<french.paragon@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include <vector>
#include <algorithm>
#include <cmath>

#include <Eigen/Core>

namespace LensMap {
namespace ImageProcessing {

template<typename T>
struct BarycentricPixCoord {
    Eigen::Matrix<int,2,1> pixCoord; //x (column), y (row)
    Eigen::Matrix<T,3,1> weights;
};

/*!
 * \brief edgeFunction twice the signed area of the triangle (from, to, pt).
 */
template<typename T>
inline T edgeFunction(Eigen::Matrix<T,2,1> const& from,
                      Eigen::Matrix<T,2,1> const& to,
                      Eigen::Matrix<T,2,1> const& pt) {
    return (to.x() - from.x())*(pt.y() - from.y()) - (to.y() - from.y())*(pt.x() - from.x());
}

/*!
 * \brief isTopLeftEdge tell if an edge of a positively oriented triangle is a top or a left edge (y axis pointing down).
 */
template<typename T>
inline bool isTopLeftEdge(Eigen::Matrix<T,2,1> const& from,
                          Eigen::Matrix<T,2,1> const& to) {

    Eigen::Matrix<T,2,1> d = to - from;

    if (d.y() == 0) {
        return d.x() > 0;
    }

    return d.y() < 0;
}

/*!
 * \brief listPixCentersInTriangle gives the list of pixels whose center lies in a triangle, with the barycentric coordinates of the center
 *
 * \param pt1 first point of the triangle, in continuous pixel coordinates
 * \param pt2 second point of the triangle
 * \param pt3 third point of the triangle
 * \param width the number of columns of the image
 * \param height the number of rows of the image
 *
 * \tparam T the compute type (floating point expected)
 *
 * Pixel (x, y) has its center at (x + 0.5, y + 0.5). Centers exactly on an edge follow the top-left convention,
 * so that a pixel on an edge shared by two triangles is listed by exactly one of them.
 * Both windings are accepted, degenerate triangles give an empty list.
 *
 * \return a list of pixels coordinates, with the weights of pt1, pt2 and pt3 (summing to 1)
 */
template<typename T>
std::vector<BarycentricPixCoord<T>> listPixCentersInTriangle(Eigen::Matrix<T,2,1> const& pt1,
                                                             Eigen::Matrix<T,2,1> const& pt2,
                                                             Eigen::Matrix<T,2,1> const& pt3,
                                                             int width,
                                                             int height) {

    std::vector<BarycentricPixCoord<T>> ret;

    T area = edgeFunction(pt1, pt2, pt3);

    if (!std::isfinite(area) or area == 0) {
        return ret;
    }

    //edges opposed to pt1, pt2 and pt3, oriented so that the inside is positive.
    bool positive = area > 0;

    Eigen::Matrix<T,2,1> const& from1 = (positive) ? pt2 : pt3;
    Eigen::Matrix<T,2,1> const& to1 = (positive) ? pt3 : pt2;

    Eigen::Matrix<T,2,1> const& from2 = (positive) ? pt3 : pt1;
    Eigen::Matrix<T,2,1> const& to2 = (positive) ? pt1 : pt3;

    Eigen::Matrix<T,2,1> const& from3 = (positive) ? pt1 : pt2;
    Eigen::Matrix<T,2,1> const& to3 = (positive) ? pt2 : pt1;

    bool topLeft1 = isTopLeftEdge(from1, to1);
    bool topLeft2 = isTopLeftEdge(from2, to2);
    bool topLeft3 = isTopLeftEdge(from3, to3);

    T absArea = std::abs(area);

    T minX = std::min({pt1.x(), pt2.x(), pt3.x()});
    T maxX = std::max({pt1.x(), pt2.x(), pt3.x()});

    T minY = std::min({pt1.y(), pt2.y(), pt3.y()});
    T maxY = std::max({pt1.y(), pt2.y(), pt3.y()});

    //clamp before the conversion, far away vertices do not fit in an int.
    int iMinX = std::max(0, static_cast<int>(std::floor(std::clamp(minX - T(0.5), T(-1), T(width)))));
    int iMaxX = std::min(width-1, static_cast<int>(std::ceil(std::clamp(maxX - T(0.5), T(-1), T(width)))));

    int iMinY = std::max(0, static_cast<int>(std::floor(std::clamp(minY - T(0.5), T(-1), T(height)))));
    int iMaxY = std::min(height-1, static_cast<int>(std::ceil(std::clamp(maxY - T(0.5), T(-1), T(height)))));

    if (iMinX > iMaxX or iMinY > iMaxY) {
        return ret;
    }

    ret.reserve((iMaxX - iMinX + 1)*(iMaxY - iMinY + 1)/2 + 1);

    for (int j = iMinY; j <= iMaxY; j++) {
        for (int i = iMinX; i <= iMaxX; i++) {

            Eigen::Matrix<T,2,1> center(i + T(0.5), j + T(0.5));

            T e1 = edgeFunction(from1, to1, center);
            T e2 = edgeFunction(from2, to2, center);
            T e3 = edgeFunction(from3, to3, center);

            if (e1 < 0 or (e1 == 0 and !topLeft1)) {
                continue;
            }

            if (e2 < 0 or (e2 == 0 and !topLeft2)) {
                continue;
            }

            if (e3 < 0 or (e3 == 0 and !topLeft3)) {
                continue;
            }

            ret.push_back({Eigen::Matrix<int,2,1>(i,j), Eigen::Matrix<T,3,1>(e1/absArea, e2/absArea, e3/absArea)});

        }
    }

    return ret;

}

} // namespace ImageProcessing
} // namespace LensMap


#endif // LENSMAP_PIXELSTRIANGLES_H
