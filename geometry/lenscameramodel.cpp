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

#include "lenscameramodel.h"

#include "geometricexception.h"

#include <algorithm>
#include <cmath>

namespace LensMap {
namespace Geometry {

LensCameraModel::LensCameraModel() :
	_f(1, 1),
	_c(0.5, 0.5),
	_coefs()
{

}

LensCameraModel::LensCameraModel(Eigen::Vector2f const& f,
								 Eigen::Vector2f const& c,
								 DistortionCoefficients<float> const& coefs) :
	_f(f),
	_c(c),
	_coefs(coefs)
{

}

Eigen::Vector2f LensCameraModel::undistortNormalizedViewPosition(Eigen::Vector2f const& engineV) const {

	Eigen::Vector2f v(engineV.x(), -engineV.y());
	Eigen::Vector2f undistorted = distortNormalizedViewPosition(v, _coefs);

	return Eigen::Vector2f(undistorted.x(), -undistorted.y());
}

bool LensCameraModel::isIdentity() const {
	LensCameraModel identity;
	return _f == identity._f and _c == identity._c and _coefs.isIdentity();
}

Eigen::Vector2f LensCameraModel::undistortViewportUVIntoViewSpace(Eigen::Vector2f const& distortedViewportUV,
																  float distortedAspectRatio) const {

	Eigen::Vector2f aspectRatioAwareF(_f.x(), -_f.y()*distortedAspectRatio);
	Eigen::Vector2f engineV = (distortedViewportUV - _c).cwiseQuotient(aspectRatioAwareF);

	return undistortNormalizedViewPosition(engineV);
}

float LensCameraModel::undistortOverscanFactor(float distortedHorizontalFOV, float distortedAspectRatio) const {

	if (isIdentity()) {
		return 1.0f;
	}

	float tanHalfDistortedHorizontalFOV = std::tan(distortedHorizontalFOV/2);

	//Key points of the distorted viewport, numbered in the view space:
	//
	//        0        1        2
	//
	//        7                 3
	//
	//        6        5        4
	Eigen::Vector2f p0 = undistortViewportUVIntoViewSpace(Eigen::Vector2f(0.0f, 0.0f), distortedAspectRatio);
	Eigen::Vector2f p1 = undistortViewportUVIntoViewSpace(Eigen::Vector2f(0.5f, 0.0f), distortedAspectRatio);
	Eigen::Vector2f p2 = undistortViewportUVIntoViewSpace(Eigen::Vector2f(1.0f, 0.0f), distortedAspectRatio);
	Eigen::Vector2f p3 = undistortViewportUVIntoViewSpace(Eigen::Vector2f(1.0f, 0.5f), distortedAspectRatio);
	Eigen::Vector2f p4 = undistortViewportUVIntoViewSpace(Eigen::Vector2f(1.0f, 1.0f), distortedAspectRatio);
	Eigen::Vector2f p5 = undistortViewportUVIntoViewSpace(Eigen::Vector2f(0.5f, 1.0f), distortedAspectRatio);
	Eigen::Vector2f p6 = undistortViewportUVIntoViewSpace(Eigen::Vector2f(0.0f, 1.0f), distortedAspectRatio);
	Eigen::Vector2f p7 = undistortViewportUVIntoViewSpace(Eigen::Vector2f(0.0f, 0.5f), distortedAspectRatio);

	//inner rectangle of the undistorted viewport in the view space
	Eigen::Vector2f minInner(std::max({p0.x(), p6.x(), p7.x()}),
							 std::max({p4.y(), p5.y(), p6.y()}));
	Eigen::Vector2f maxInner(std::min({p2.x(), p3.x(), p4.x()}),
							 std::min({p0.y(), p1.y(), p2.y()}));

	if (!(minInner.x() < 0.f and minInner.y() < 0.f and maxInner.x() > 0.f and maxInner.y() > 0.f)) {
		throw GeometricException("The undistorted viewport does not contain the optical center, cannot estimate the overscan factor");
	}

	float tanHalfDistortedVerticalFOV = tanHalfDistortedHorizontalFOV/distortedAspectRatio;

	float scaleX = 0.5f*tanHalfDistortedHorizontalFOV/std::max(-minInner.x(), maxInner.x());
	float scaleY = 0.5f*tanHalfDistortedVerticalFOV/std::max(-minInner.y(), maxInner.y());

	return std::max(scaleX, scaleY)*overscanMargin;
}

} // namespace Geometry
} // namespace LensMap
