#ifndef LENSMAP_DISPLACEMENTMAPPARAMETERS_H
#define LENSMAP_DISPLACEMENTMAPPARAMETERS_H

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

#include "../geometry/lensdistortion.h"
#include "../geometry/viewportcoordinates.h"
#include "../geometry/lensviewportmapping.h"
#include "../geometry/lenscameramodel.h"

#include <Eigen/Core>

namespace LensMap {
namespace Interpolation {

/*!
 * \brief The UncoveredPixelsPolicy enum tell what to write in the undistorted to distorted channels for pixels the undistorted grid does not reach.
 */
enum class UncoveredPixelsPolicy : char {
	NewtonInverse, //! \brief use the exact inverse of the lens model.
	ZeroDisplacement, //! \brief write a null displacement.
	NotANumber //! \brief write NaN, like an uninitialized render target would leave garbage.
};

/*!
 * \brief The DisplacementMapParameters struct gather everything a displacement map generation pass consumes.
 *
 * The generation itself does not validate anything, call validate() at the configuration boundary.
 */
struct DisplacementMapParameters {

	DisplacementMapParameters();
	DisplacementMapParameters(int width, int height);

	/*!
	 * \brief pixelUVSize the size of one output pixel in viewport UV.
	 */
	Eigen::Vector2f pixelUVSize() const;

	Geometry::LensViewportMapping mapping() const;

	/*!
	 * \brief validate check the parameters can produce a finite displacement map.
	 * \throws Geometry::GeometricException describing the first invalid parameter.
	 */
	void validate() const;

	int width;
	int height;

	Geometry::DistortionCoefficients<float> coefficients;

	Geometry::CameraMatrix<float> undistortedCamera;
	Geometry::CameraMatrix<float> distortedCamera;

	Eigen::Vector2f outputMultiplyAndAdd;

	Eigen::Vector2i gridSubdivision;

	UncoveredPixelsPolicy uncoveredPixelsPolicy;

	static constexpr int defaultGridSubdivisionX = 32;
	static constexpr int defaultGridSubdivisionY = 16;
};

/*!
 * \brief compileCameraModel derive the camera matrices of a displacement map pass from a calibrated lens.
 * \param model the lens.
 * \param distortedHorizontalFOV the horizontal field of view of the distorted camera, in radians.
 * \param distortedAspectRatio the width / height ratio of the distorted viewport.
 * \param undistortOverscanFactor the scale of the undistorted viewport (see Geometry::LensCameraModel::undistortOverscanFactor).
 * \param width the width of the displacement map.
 * \param height the height of the displacement map.
 * \param outputMultiply the scale applied to the four output channels.
 * \param outputAdd the offset applied to the four output channels.
 * \return the parameters, not validated yet.
 */
DisplacementMapParameters compileCameraModel(Geometry::LensCameraModel const& model,
											 float distortedHorizontalFOV,
											 float distortedAspectRatio,
											 float undistortOverscanFactor,
											 int width,
											 int height,
											 float outputMultiply = 1,
											 float outputAdd = 0);

} // namespace Interpolation
} // namespace LensMap

#endif // LENSMAP_DISPLACEMENTMAPPARAMETERS_H
