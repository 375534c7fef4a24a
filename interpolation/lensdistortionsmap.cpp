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

#include "lensdistortionsmap.h"

#include "./distortiongrid.h"

#include <limits>

namespace LensMap {
namespace Interpolation {

Eigen::Vector2f pixelPosition2ViewportUV(Eigen::Vector2f const& pixelPosition, Eigen::Vector2f const& pixelUVSize) {
	return pixelPosition.cwiseProduct(pixelUVSize) - pixelUVSize*0.5f;
}

Eigen::Vector4f emitDisplacement(Eigen::Vector2f const& pixelPosition,
								 Eigen::Vector2f const& interpolatedDistortedUV,
								 Geometry::LensViewportMapping const& mapping,
								 Eigen::Vector2f const& pixelUVSize,
								 Eigen::Vector2f const& outputMultiplyAndAdd) {

	Eigen::Vector2f viewportUV = pixelPosition2ViewportUV(pixelPosition, pixelUVSize);

	Eigen::Vector2f distortToUndistort = mapping.undistortViewportUV(viewportUV) - viewportUV;
	Eigen::Vector2f undistortToDistort = interpolatedDistortedUV - viewportUV;

	Eigen::Vector4f displacement(distortToUndistort.x(), distortToUndistort.y(), undistortToDistort.x(), undistortToDistort.y());

	return Eigen::Vector4f::Constant(outputMultiplyAndAdd[1]) + outputMultiplyAndAdd[0]*displacement;
}

DisplacementMap computeLensDisplacementMap(DisplacementMapParameters const& parameters) {
	CoverageMask coverage;
	return computeLensDisplacementMap(parameters, coverage);
}

DisplacementMap computeLensDisplacementMap(DisplacementMapParameters const& parameters, CoverageMask & coverage) {

	constexpr Multidim::AccessCheck Nc = Multidim::AccessCheck::Nocheck;

	int height = parameters.height;
	int width = parameters.width;

	Geometry::LensViewportMapping mapping = parameters.mapping();
	Eigen::Vector2f pixelUVSize = parameters.pixelUVSize();

	DistortionGrid grid(parameters.gridSubdivision);

	//all the vertices are needed before any pixel can be interpolated.
	std::vector<GridVertex> vertices = grid.evaluateVertices(mapping, pixelUVSize);

	InterpolatedViewportUVs interpolated = rasterizeDistortedUVs(vertices, width, height);

	DisplacementMap out(height, width, 4);

	#pragma omp parallel for
	for (int i = 0; i < height; i++) {
		for (int j = 0; j < width; j++) {

			Eigen::Vector2f pixelPosition(j + 0.5f, i + 0.5f);
			Eigen::Vector2f distortedUV;

			if (interpolated.coverage.value<Nc>(i,j)) {
				distortedUV = Eigen::Vector2f(interpolated.distortedViewportUVs.value<Nc>(i,j,0),
											  interpolated.distortedViewportUVs.value<Nc>(i,j,1));
			} else {

				Eigen::Vector2f viewportUV = pixelPosition2ViewportUV(pixelPosition, pixelUVSize);

				switch (parameters.uncoveredPixelsPolicy) {
				case UncoveredPixelsPolicy::NewtonInverse:
					distortedUV = mapping.distortViewportUV(viewportUV);
					break;
				case UncoveredPixelsPolicy::ZeroDisplacement:
					distortedUV = viewportUV;
					break;
				case UncoveredPixelsPolicy::NotANumber:
					distortedUV = Eigen::Vector2f::Constant(std::numeric_limits<float>::quiet_NaN());
					break;
				}
			}

			Eigen::Vector4f texel = emitDisplacement(pixelPosition, distortedUV, mapping, pixelUVSize, parameters.outputMultiplyAndAdd);

			for (int c = 0; c < 4; c++) {
				out.at<Nc>(i,j,c) = texel[c];
			}
		}
	}

	coverage = interpolated.coverage;

	return out;
}

} // namespace Interpolation
} // namespace LensMap
