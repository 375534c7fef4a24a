#ifndef LENSMAP_LENSDISTORTIONSMAP_H
#define LENSMAP_LENSDISTORTIONSMAP_H

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

#include "../lensmap_global.h"
#include "./displacementmapparameters.h"

#include <Eigen/Core>

namespace LensMap {
namespace Interpolation {

/*!
 * \brief pixelPosition2ViewportUV give the top-left originated viewport UV of a pixel position (pixel (i,j) being at (j+0.5, i+0.5)).
 */
Eigen::Vector2f pixelPosition2ViewportUV(Eigen::Vector2f const& pixelPosition, Eigen::Vector2f const& pixelUVSize);

/*!
 * \brief emitDisplacement compute the four channels of a displacement map texel.
 * \param pixelPosition the position of the pixel center.
 * \param interpolatedDistortedUV the distorted viewport UV interpolated over the undistorted grid at that pixel.
 * \param mapping the lens mapping.
 * \param pixelUVSize the size of one pixel in viewport UV.
 * \param outputMultiplyAndAdd the (multiply, add) transform applied to all the channels.
 * \return (distort to undistort x, y, undistort to distort x, y), transformed.
 */
Eigen::Vector4f emitDisplacement(Eigen::Vector2f const& pixelPosition,
								 Eigen::Vector2f const& interpolatedDistortedUV,
								 Geometry::LensViewportMapping const& mapping,
								 Eigen::Vector2f const& pixelUVSize,
								 Eigen::Vector2f const& outputMultiplyAndAdd);

/*!
 * \brief computeLensDisplacementMap run a full generation pass.
 * \param parameters the pass parameters, they are expected to be valid (see DisplacementMapParameters::validate).
 * \return a height x width x 4 displacement map.
 */
DisplacementMap computeLensDisplacementMap(DisplacementMapParameters const& parameters);

/*!
 * \brief computeLensDisplacementMap run a full generation pass.
 * \param parameters the pass parameters, they are expected to be valid (see DisplacementMapParameters::validate).
 * \param coverage filled with the pixels the undistorted grid covered.
 * \return a height x width x 4 displacement map.
 */
DisplacementMap computeLensDisplacementMap(DisplacementMapParameters const& parameters, CoverageMask & coverage);

} // namespace Interpolation
} // namespace LensMap

#endif // LENSMAP_LENSDISTORTIONSMAP_H
