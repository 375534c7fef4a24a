#ifndef LENSMAP_LENSCAMERAMODEL_H
#define LENSMAP_LENSCAMERAMODEL_H

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

#include <Eigen/Core>

namespace LensMap {
namespace Geometry {

/*!
 * \brief The LensCameraModel class describe a calibrated lens, as delivered by a calibration tool.
 *
 * The focal is normalized by the viewport width and the principal point is expressed in viewport UV.
 */
class LensCameraModel
{
public:
	LensCameraModel();
	LensCameraModel(Eigen::Vector2f const& f,
					Eigen::Vector2f const& c,
					DistortionCoefficients<float> const& coefs);

	/*!
	 * \brief undistortNormalizedViewPosition apply the lens model to a view position expressed in the engine view space (Y pointing down).
	 */
	Eigen::Vector2f undistortNormalizedViewPosition(Eigen::Vector2f const& engineV) const;

	/*!
	 * \brief undistortOverscanFactor estimate by how much the undistorted viewport has to be scaled up to cover the distorted viewport.
	 * \param distortedHorizontalFOV the horizontal field of view of the distorted camera, in radians.
	 * \param distortedAspectRatio the width / height ratio of the distorted viewport.
	 * \return the scale factor, 1 for a model without distortion.
	 *
	 * The model is evaluated at the corners and edges midpoints of the distorted viewport only.
	 * This is very approximative but works well in practice, a small extra margin is added to account
	 * for tangential distortion moving the extremal points away from the sampled ones.
	 *
	 * \throws GeometricException if the undistorted key points do not surround the optical center.
	 */
	float undistortOverscanFactor(float distortedHorizontalFOV, float distortedAspectRatio) const;

	bool isIdentity() const;

	inline Eigen::Vector2f const& f() const {
		return _f;
	}

	inline Eigen::Vector2f const& c() const {
		return _c;
	}

	inline DistortionCoefficients<float> const& coefficients() const {
		return _coefs;
	}

	static constexpr float overscanMargin = 1.02f;

protected:

	Eigen::Vector2f undistortViewportUVIntoViewSpace(Eigen::Vector2f const& distortedViewportUV, float distortedAspectRatio) const;

	Eigen::Vector2f _f;
	Eigen::Vector2f _c;
	DistortionCoefficients<float> _coefs;
};

} // namespace Geometry
} // namespace LensMap

#endif // LENSMAP_LENSCAMERAMODEL_H
