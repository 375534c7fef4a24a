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

#include "distortiongrid.h"

#include "../geometry/viewportcoordinates.h"
#include "../imageProcessing/pixelsTriangles.h"

#include <limits>

namespace LensMap {
namespace Interpolation {

DistortionGrid::DistortionGrid(int subdivisionX, int subdivisionY) :
	_subdivisionX(subdivisionX),
	_subdivisionY(subdivisionY)
{

}

DistortionGrid::DistortionGrid(Eigen::Vector2i const& subdivision) :
	DistortionGrid(subdivision.x(), subdivision.y())
{

}

Eigen::Vector2f DistortionGrid::cellVertexUV(int cellVertexId) {
	return Eigen::Vector2f(static_cast<float>(0x1 & ((cellVertexId + 1)/3)), static_cast<float>(cellVertexId & 0x1));
}

Eigen::Vector2f DistortionGrid::distortedGridUV(int vertexIndex, Eigen::Vector2f const& pixelUVSize) const {

	int cellIndex = vertexIndex/verticesPerCell;
	int column = cellIndex/_subdivisionY;
	int row = cellIndex%_subdivisionY;
	int cellVertexId = vertexIndex%verticesPerCell;

	Eigen::Vector2f gridInvSize(1.f/static_cast<float>(_subdivisionX), 1.f/static_cast<float>(_subdivisionY));

	Eigen::Vector2f cellUV = cellVertexUV(cellVertexId) + Eigen::Vector2f(static_cast<float>(column), static_cast<float>(row));
	Eigen::Vector2f gridUV = Geometry::flipViewportUV<float>(gridInvSize.cwiseProduct(cellUV));

	return gridUV - pixelUVSize*0.5f;
}

GridVertex DistortionGrid::evaluateVertex(int vertexIndex,
										  Geometry::LensViewportMapping const& mapping,
										  Eigen::Vector2f const& pixelUVSize) const {

	GridVertex ret;

	ret.distortedViewportUV = distortedGridUV(vertexIndex, pixelUVSize);

	Eigen::Vector2f undistortedUV = mapping.undistortViewportUV(ret.distortedViewportUV) + pixelUVSize*0.5f;
	Eigen::Vector2f clip = Geometry::flipViewportUV<float>(undistortedUV)*2.f - Eigen::Vector2f::Ones();

	ret.position = Eigen::Vector4f(clip.x(), clip.y(), 0.f, 1.f);

	return ret;
}

std::vector<GridVertex> DistortionGrid::evaluateVertices(Geometry::LensViewportMapping const& mapping,
														 Eigen::Vector2f const& pixelUVSize) const {

	int nVerts = nVertices();

	std::vector<GridVertex> ret(nVerts);

	#pragma omp parallel for
	for (int v = 0; v < nVerts; v++) {
		ret[v] = evaluateVertex(v, mapping, pixelUVSize);
	}

	return ret;
}

Eigen::Vector2f clip2PixelCoordinates(Eigen::Vector4f const& clipPosition, int width, int height) {

	float x = clipPosition.x()/clipPosition.w();
	float y = clipPosition.y()/clipPosition.w();

	return Eigen::Vector2f((x + 1.f)*0.5f*width, (1.f - y)*0.5f*height);
}

InterpolatedViewportUVs rasterizeDistortedUVs(std::vector<GridVertex> const& vertices, int width, int height) {

	constexpr Multidim::AccessCheck Nc = Multidim::AccessCheck::Nocheck;

	InterpolatedViewportUVs ret{Multidim::Array<float, 3>(height, width, 2), CoverageMask(height, width)};

	for (int i = 0; i < height; i++) {
		for (int j = 0; j < width; j++) {
			ret.distortedViewportUVs.at<Nc>(i,j,0) = std::numeric_limits<float>::quiet_NaN();
			ret.distortedViewportUVs.at<Nc>(i,j,1) = std::numeric_limits<float>::quiet_NaN();
			ret.coverage.at<Nc>(i,j) = false;
		}
	}

	int nTriangles = static_cast<int>(vertices.size())/3;

	for (int t = 0; t < nTriangles; t++) {

		GridVertex const& v1 = vertices[3*t];
		GridVertex const& v2 = vertices[3*t+1];
		GridVertex const& v3 = vertices[3*t+2];

		Eigen::Vector2d pt1 = clip2PixelCoordinates(v1.position, width, height).cast<double>();
		Eigen::Vector2d pt2 = clip2PixelCoordinates(v2.position, width, height).cast<double>();
		Eigen::Vector2d pt3 = clip2PixelCoordinates(v3.position, width, height).cast<double>();

		std::vector<ImageProcessing::BarycentricPixCoord<double>> pixels =
				ImageProcessing::listPixCentersInTriangle(pt1, pt2, pt3, width, height);

		Eigen::Vector2d uv1 = v1.distortedViewportUV.cast<double>();
		Eigen::Vector2d uv2 = v2.distortedViewportUV.cast<double>();
		Eigen::Vector2d uv3 = v3.distortedViewportUV.cast<double>();

		for (ImageProcessing::BarycentricPixCoord<double> const& pix : pixels) {

			Eigen::Vector2d uv = pix.weights[0]*uv1 + pix.weights[1]*uv2 + pix.weights[2]*uv3;

			int i = pix.pixCoord.y();
			int j = pix.pixCoord.x();

			ret.distortedViewportUVs.at<Nc>(i,j,0) = static_cast<float>(uv.x());
			ret.distortedViewportUVs.at<Nc>(i,j,1) = static_cast<float>(uv.y());
			ret.coverage.at<Nc>(i,j) = true;
		}
	}

	return ret;
}

} // namespace Interpolation
} // namespace LensMap
