#ifndef LENSMAP_LENSVIEWPORTMAPPING_H
#define LENSMAP_LENSVIEWPORTMAPPING_H

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

#include "./lensdistortion.h"
#include "./viewportcoordinates.h"

#include <Eigen/Core>

namespace LensMap {
namespace Geometry {

/*!
 * \brief The LensViewportMapping class map viewport UV coordinates between the distorted and the undistorted cameras.
 *
 * The lens model is only known in the forward direction. undistortViewportUV composes it between the distorted
 * camera matrix (on the input side) and the undistorted camera matrix (on the output side), and is thus closed-form.
 * distortViewportUV goes the other way and relies on Newton iterations.
 */
class LensViewportMapping
{
public:
	LensViewportMapping(DistortionCoefficients<float> const& coefs,
						CameraMatrix<float> const& undistortedCamera,
						CameraMatrix<float> const& distortedCamera);

	/*!
	 * \brief undistortViewportUV give the undistorted viewport UV matching a distorted viewport UV.
	 * \param distortedUV the distorted viewport UV.
	 * \return the UV in the undistorted viewport.
	 */
	Eigen::Vector2f undistortViewportUV(Eigen::Vector2f const& distortedUV) const;

	/*!
	 * \brief distortViewportUV give the distorted viewport UV matching an undistorted viewport UV.
	 * \param undistortedUV the undistorted viewport UV.
	 * \param iters the number of Newton iterations.
	 * \return the UV in the distorted viewport.
	 */
	Eigen::Vector2f distortViewportUV(Eigen::Vector2f const& undistortedUV, int iters = defaultInverseIterations) const;

	inline DistortionCoefficients<float> const& coefficients() const {
		return _coefs;
	}

	inline CameraMatrix<float> const& undistortedCamera() const {
		return _undistortedCamera;
	}

	inline CameraMatrix<float> const& distortedCamera() const {
		return _distortedCamera;
	}

	static constexpr int defaultInverseIterations = 10;

protected:

	DistortionCoefficients<float> _coefs;
	CameraMatrix<float> _undistortedCamera;
	CameraMatrix<float> _distortedCamera;
};

} // namespace Geometry
} // namespace LensMap

#endif // LENSMAP_LENSVIEWPORTMAPPING_H
