#ifndef LENSMAP_VIEWPORTCOORDINATES_H
#define LENSMAP_VIEWPORTCOORDINATES_H

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

#include <Eigen/Core>

#include <type_traits>

namespace LensMap {
namespace Geometry {

/*!
 * \brief The CameraMatrix struct is the affine intrinsic transform between the z = 1 plane and the viewport UV coordinates.
 *
 * f holds the scale factors (fx, fy), c the translation (cx, cy).
 */
template<typename T>
struct CameraMatrix {

	static_assert (std::is_floating_point_v<T>, "The camera matrix should use float point types");

	CameraMatrix() :
		f(1, 1),
		c(0, 0)
	{

	}

	CameraMatrix(T fx, T fy, T cx, T cy) :
		f(fx, fy),
		c(cx, cy)
	{

	}

	explicit CameraMatrix(Eigen::Matrix<T, 4, 1> const& fxfycxcy) :
		f(fxfycxcy[0], fxfycxcy[1]),
		c(fxfycxcy[2], fxfycxcy[3])
	{

	}

	inline Eigen::Matrix<T, 4, 1> toVector() const {
		return Eigen::Matrix<T, 4, 1>(f.x(), f.y(), c.x(), c.y());
	}

	/*!
	 * \brief isDegenerate indicate if the matrix cannot be inverted (a null scale) or contains non finite values.
	 */
	inline bool isDegenerate() const {
		return f.x() == 0 or f.y() == 0 or !f.allFinite() or !c.allFinite();
	}

	inline bool operator==(CameraMatrix<T> const& other) const {
		return f == other.f and c == other.c;
	}

	Eigen::Matrix<T, 2, 1> f;
	Eigen::Matrix<T, 2, 1> c;
};

template<typename Pos_T, typename M_T>
inline Eigen::Matrix<Pos_T, 2, 1> viewportUV2ViewCoordinates(Eigen::Matrix<Pos_T, 2, 1> const& uv,
															 CameraMatrix<M_T> const& cameraMatrix) {

	Eigen::Matrix<Pos_T, 2, 1> r = uv - cameraMatrix.c.template cast<Pos_T>();
	r[0] /= static_cast<Pos_T>(cameraMatrix.f[0]);
	r[1] /= static_cast<Pos_T>(cameraMatrix.f[1]);

	return r;
}

template<typename Pos_T, typename M_T>
inline Eigen::Matrix<Pos_T, 2, 1> view2ViewportUVCoordinates(Eigen::Matrix<Pos_T, 2, 1> const& view,
															 CameraMatrix<M_T> const& cameraMatrix) {

	Eigen::Matrix<Pos_T, 2, 1> r = view;
	r[0] *= static_cast<Pos_T>(cameraMatrix.f[0]);
	r[1] *= static_cast<Pos_T>(cameraMatrix.f[1]);
	r += cameraMatrix.c.template cast<Pos_T>();

	return r;
}

/*!
 * \brief flipViewportUV switch between bottom-left and top-left originated viewport UV.
 */
template<typename Pos_T>
inline Eigen::Matrix<Pos_T, 2, 1> flipViewportUV(Eigen::Matrix<Pos_T, 2, 1> const& uv) {
	return Eigen::Matrix<Pos_T, 2, 1>(uv.x(), Pos_T(1) - uv.y());
}

} // namespace Geometry
} // namespace LensMap

#endif // LENSMAP_VIEWPORTCOORDINATES_H
