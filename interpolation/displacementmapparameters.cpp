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

#include "displacementmapparameters.h"

#include "./distortiongrid.h"
#include "../geometry/geometricexception.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace LensMap {
namespace Interpolation {

DisplacementMapParameters::DisplacementMapParameters() :
	DisplacementMapParameters(0, 0)
{

}

DisplacementMapParameters::DisplacementMapParameters(int width, int height) :
	width(width),
	height(height),
	coefficients(),
	undistortedCamera(),
	distortedCamera(),
	outputMultiplyAndAdd(1, 0),
	gridSubdivision(defaultGridSubdivisionX, defaultGridSubdivisionY),
	uncoveredPixelsPolicy(UncoveredPixelsPolicy::NewtonInverse)
{

}

Eigen::Vector2f DisplacementMapParameters::pixelUVSize() const {
	return Eigen::Vector2f(1.f/static_cast<float>(width), 1.f/static_cast<float>(height));
}

Geometry::LensViewportMapping DisplacementMapParameters::mapping() const {
	return Geometry::LensViewportMapping(coefficients, undistortedCamera, distortedCamera);
}

void DisplacementMapParameters::validate() const {

	if (width <= 0 or height <= 0) {
		std::stringstream strs;
		strs << "Invalid displacement map size " << width << "x" << height;
		throw Geometry::GeometricException(strs.str());
	}

	if (gridSubdivision.x() <= 0 or gridSubdivision.y() <= 0) {
		std::stringstream strs;
		strs << "Invalid grid subdivision " << gridSubdivision.x() << "x" << gridSubdivision.y();
		throw Geometry::GeometricException(strs.str());
	}

	int64_t nVertices = int64_t(DistortionGrid::verticesPerCell)*gridSubdivision.x()*gridSubdivision.y();

	if (nVertices > std::numeric_limits<int>::max()) {
		std::stringstream strs;
		strs << "Grid subdivision " << gridSubdivision.x() << "x" << gridSubdivision.y() << " has too many vertices (" << nVertices << ")";
		throw Geometry::GeometricException(strs.str());
	}

	if (!coefficients.allFinite()) {
		throw Geometry::GeometricException("Non finite distortion coefficients");
	}

	if (undistortedCamera.isDegenerate()) {
		throw Geometry::GeometricException("Degenerate undistorted camera matrix (null or non finite focal, or non finite principal point)");
	}

	if (distortedCamera.isDegenerate()) {
		throw Geometry::GeometricException("Degenerate distorted camera matrix (null or non finite focal, or non finite principal point)");
	}

	if (!outputMultiplyAndAdd.allFinite()) {
		throw Geometry::GeometricException("Non finite output multiply and add");
	}
}

DisplacementMapParameters compileCameraModel(Geometry::LensCameraModel const& model,
											 float distortedHorizontalFOV,
											 float distortedAspectRatio,
											 float undistortOverscanFactor,
											 int width,
											 int height,
											 float outputMultiply,
											 float outputAdd) {

	float tanHalfUndistortedHorizontalFOV = std::tan(distortedHorizontalFOV/2)*undistortOverscanFactor;
	float tanHalfUndistortedVerticalFOV = tanHalfUndistortedHorizontalFOV/distortedAspectRatio;

	DisplacementMapParameters ret(width, height);

	ret.coefficients = model.coefficients();

	ret.distortedCamera = Geometry::CameraMatrix<float>(1.0f/tanHalfUndistortedHorizontalFOV,
														1.0f/tanHalfUndistortedVerticalFOV,
														0.5f,
														0.5f);

	ret.undistortedCamera = Geometry::CameraMatrix<float>(model.f().x(),
														  model.f().y()*distortedAspectRatio,
														  model.c().x(),
														  model.c().y());

	ret.outputMultiplyAndAdd = Eigen::Vector2f(outputMultiply, outputAdd);

	return ret;
}

} // namespace Interpolation
} // namespace LensMap
