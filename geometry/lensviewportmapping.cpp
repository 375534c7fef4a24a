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

#include "lensviewportmapping.h"

namespace LensMap {
namespace Geometry {

LensViewportMapping::LensViewportMapping(DistortionCoefficients<float> const& coefs,
										 CameraMatrix<float> const& undistortedCamera,
										 CameraMatrix<float> const& distortedCamera) :
	_coefs(coefs),
	_undistortedCamera(undistortedCamera),
	_distortedCamera(distortedCamera)
{

}

Eigen::Vector2f LensViewportMapping::undistortViewportUV(Eigen::Vector2f const& distortedUV) const {

	Eigen::Vector2f distortedView = viewportUV2ViewCoordinates(distortedUV, _distortedCamera);
	Eigen::Vector2f undistortedView = distortNormalizedViewPosition(distortedView, _coefs);

	return view2ViewportUVCoordinates(undistortedView, _undistortedCamera);
}

Eigen::Vector2f LensViewportMapping::distortViewportUV(Eigen::Vector2f const& undistortedUV, int iters) const {

	//Newton iterations run in double precision
	Eigen::Vector2d uv = undistortedUV.cast<double>();
	Eigen::Vector2d undistortedView = viewportUV2ViewCoordinates(uv, _undistortedCamera);
	Eigen::Vector2d distortedView = invertDistortion(undistortedView, _coefs, iters);

	return view2ViewportUVCoordinates(distortedView, _distortedCamera).cast<float>();
}

} // namespace Geometry
} // namespace LensMap
