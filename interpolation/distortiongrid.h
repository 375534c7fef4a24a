#ifndef LENSMAP_DISTORTIONGRID_H
#define LENSMAP_DISTORTIONGRID_H

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
#include "../geometry/lensviewportmapping.h"

#include <Eigen/Core>

#include <vector>

namespace LensMap {
namespace Interpolation {

struct GridVertex {
	Eigen::Vector4f position; //! \brief clip space position, where the undistorted equivalent of the vertex lands.
	Eigen::Vector2f distortedViewportUV; //! \brief top-left originated distorted viewport UV carried by the vertex.
};

/*!
 * \brief The InterpolatedViewportUVs struct hold the distorted viewport UV interpolated over the undistorted grid, per pixel.
 */
struct InterpolatedViewportUVs {
	Multidim::Array<float, 3> distortedViewportUVs; //! \brief height x width x 2
	CoverageMask coverage; //! \brief true where a triangle of the grid covered the pixel center.
};

/*!
 * \brief The DistortionGrid class tessellate the viewport in subdivisionX x subdivisionY cells of two triangles each.
 *
 * Each vertex of the grid is undistorted analytically, and the distorted viewport UV it carries is then interpolated
 * linearly over the undistorted triangles. This gives a piecewise linear approximation of the undistorted to distorted
 * mapping, which has no closed form, without running a solver per pixel. The finer the grid, the smaller the error,
 * at the price of 6 vertices per cell.
 *
 * The vertices are not stored, a vertex is fully determined by its index.
 */
class DistortionGrid
{
public:

	static constexpr int verticesPerCell = 6;

	DistortionGrid(int subdivisionX, int subdivisionY);
	explicit DistortionGrid(Eigen::Vector2i const& subdivision);

	inline int subdivisionX() const {
		return _subdivisionX;
	}

	inline int subdivisionY() const {
		return _subdivisionY;
	}

	inline int nCells() const {
		return _subdivisionX*_subdivisionY;
	}

	inline int nVertices() const {
		return verticesPerCell*nCells();
	}

	inline int nTriangles() const {
		return 2*nCells();
	}

	/*!
	 * \brief cellVertexUV give the bottom-left originated UV of a triangle vertex in its cell.
	 * \param cellVertexId the index of the vertex in the cell, in [0, 6).
	 *
	 * The two triangles are (0,0) (0,1) (1,0) and (1,1) (1,0) (0,1), sharing the (0,1) (1,0) diagonal.
	 */
	static Eigen::Vector2f cellVertexUV(int cellVertexId);

	/*!
	 * \brief distortedGridUV give the top-left originated distorted viewport UV of a vertex, shifted to the pixels centers convention.
	 */
	Eigen::Vector2f distortedGridUV(int vertexIndex, Eigen::Vector2f const& pixelUVSize) const;

	GridVertex evaluateVertex(int vertexIndex,
							  Geometry::LensViewportMapping const& mapping,
							  Eigen::Vector2f const& pixelUVSize) const;

	/*!
	 * \brief evaluateVertices compute all the vertices of the grid, in vertex index order.
	 */
	std::vector<GridVertex> evaluateVertices(Geometry::LensViewportMapping const& mapping,
											 Eigen::Vector2f const& pixelUVSize) const;

protected:

	int _subdivisionX;
	int _subdivisionY;
};

/*!
 * \brief clip2PixelCoordinates apply the viewport transform to a clip space position.
 * \return continuous pixel coordinates (x to the right, y down), pixel (i,j) having its center at (j+0.5, i+0.5).
 */
Eigen::Vector2f clip2PixelCoordinates(Eigen::Vector4f const& clipPosition, int width, int height);

/*!
 * \brief rasterizeDistortedUVs interpolate the distorted viewport UV of the vertices over the pixels of a width x height viewport.
 * \param vertices the vertices, three consecutive vertices forming a triangle.
 * \param width the viewport width.
 * \param height the viewport height.
 * \return the interpolated UVs (NaN where no triangle covers the pixel) and the coverage mask.
 *
 * Triangles are processed in order, a pixel covered by two triangles keep the value of the last one.
 */
InterpolatedViewportUVs rasterizeDistortedUVs(std::vector<GridVertex> const& vertices, int width, int height);

} // namespace Interpolation
} // namespace LensMap

#endif // LENSMAP_DISTORTIONGRID_H
