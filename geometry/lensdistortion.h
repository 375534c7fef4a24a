#ifndef LENSMAP_LENSDISTORTION_H
#define LENSMAP_LENSDISTORTION_H

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

#include <Eigen/Dense>

#include <type_traits>

namespace LensMap {
namespace Geometry {

/*!
 * \brief The DistortionCoefficients struct hold the radial (k1, k2, k3) and tangential (p1, p2) coefficients of a Brown-Conrady lens model.
 */
template<typename T>
struct DistortionCoefficients {

	static_assert (std::is_floating_point_v<T>, "The distortion coefficients should be float point types");

	DistortionCoefficients() :
		k123(Eigen::Matrix<T, 3, 1>::Zero()),
		p12(Eigen::Matrix<T, 2, 1>::Zero())
	{

	}

	DistortionCoefficients(Eigen::Matrix<T, 3, 1> const& k, Eigen::Matrix<T, 2, 1> const& p) :
		k123(k),
		p12(p)
	{

	}

	DistortionCoefficients(T k1, T k2, T k3, T p1, T p2) :
		k123(k1, k2, k3),
		p12(p1, p2)
	{

	}

	inline bool isIdentity() const {
		return k123.isZero(0) and p12.isZero(0);
	}

	inline bool allFinite() const {
		return k123.allFinite() and p12.allFinite();
	}

	Eigen::Matrix<T, 3, 1> k123;
	Eigen::Matrix<T, 2, 1> p12;
};

/*!
 * \brief radialScale compute 1 + k1 r^2 + k2 r^4 + k3 r^6
 *
 * The polynomial is evaluated as 1 + r2*(k1 + r2*(k2 + r2*k3)).
 */
template<typename Pos_T, typename K_T>
inline Pos_T radialScale(Pos_T r2, Eigen::Matrix<K_T, 3, 1> const& k123) {

	static_assert (std::is_floating_point_v<Pos_T> and std::is_floating_point_v<K_T>, "The position and k parameters type should be float point types");

	Pos_T k1 = static_cast<Pos_T>(k123[0]);
	Pos_T k2 = static_cast<Pos_T>(k123[1]);
	Pos_T k3 = static_cast<Pos_T>(k123[2]);

	return Pos_T(1) + r2*(k1 + r2*(k2 + r2*k3));
}

template<typename Pos_T, typename T_T>
Eigen::Matrix<Pos_T, 2, 1> tangentialDistortion(Eigen::Matrix<Pos_T, 2, 1> const& pos, Eigen::Matrix<T_T, 2, 1> const& p12) {

	static_assert (std::is_floating_point_v<Pos_T> and std::is_floating_point_v<T_T>, "The position and p parameters type should be float point types");

	Pos_T p1 = static_cast<Pos_T>(p12[0]);
	Pos_T p2 = static_cast<Pos_T>(p12[1]);

	Pos_T r2 = pos(0)*pos(0) + pos(1)*pos(1);

	Eigen::Matrix<Pos_T, 2, 1> td;
	td << p2*(r2 + Pos_T(2)*pos(0)*pos(0)) + Pos_T(2)*p1*pos(0)*pos(1),
			p1*(r2 + Pos_T(2)*pos(1)*pos(1)) + Pos_T(2)*p2*pos(0)*pos(1);

	return td;
}

/*!
 * \brief distortNormalizedViewPosition apply the lens model to a position on the z = 1 plane.
 * \param pos the normalized view position.
 * \param coefs the lens coefficients.
 * \return the distorted normalized view position.
 *
 * The function is total: no check is done on the domain, large radii make the polynomial diverge.
 */
template<typename Pos_T, typename C_T>
Eigen::Matrix<Pos_T, 2, 1> distortNormalizedViewPosition(Eigen::Matrix<Pos_T, 2, 1> const& pos,
														 DistortionCoefficients<C_T> const& coefs) {

	Pos_T r2 = pos(0)*pos(0) + pos(1)*pos(1);
	Pos_T scale = radialScale(r2, coefs.k123);

	Eigen::Matrix<Pos_T, 2, 1> distorted = pos*scale;
	distorted += tangentialDistortion(pos, coefs.p12);

	return distorted;
}

/*!
 * \brief distortionJacobian compute the jacobian of distortNormalizedViewPosition with respect to the position.
 */
template<typename Pos_T, typename C_T>
Eigen::Matrix<Pos_T, 2, 2> distortionJacobian(Eigen::Matrix<Pos_T, 2, 1> const& pos,
											  DistortionCoefficients<C_T> const& coefs) {

	Pos_T k1 = static_cast<Pos_T>(coefs.k123[0]);
	Pos_T k2 = static_cast<Pos_T>(coefs.k123[1]);
	Pos_T k3 = static_cast<Pos_T>(coefs.k123[2]);

	Pos_T p1 = static_cast<Pos_T>(coefs.p12[0]);
	Pos_T p2 = static_cast<Pos_T>(coefs.p12[1]);

	Pos_T x = pos(0);
	Pos_T y = pos(1);

	Pos_T r2 = x*x + y*y;

	Pos_T s = radialScale(r2, coefs.k123);
	Pos_T dsdr2 = k1 + r2*(2*k2 + 3*k3*r2);

	Eigen::Matrix<Pos_T, 2, 2> df;
	df << s + 2*x*x*dsdr2 + 6*p2*x + 2*p1*y, 2*x*y*dsdr2 + 2*p2*y + 2*p1*x,
		  2*x*y*dsdr2 + 2*p1*x + 2*p2*y, s + 2*y*y*dsdr2 + 6*p1*y + 2*p2*x;

	return df;
}

/*!
 * \brief invertDistortion find the normalized view position that distortNormalizedViewPosition send to pos.
 * \param pos the distorted normalized view position.
 * \param coefs the lens coefficients.
 * \param iters the number of Newton iterations.
 * \return the undistorted normalized view position.
 *
 * This is a Newton-Raphson solver on the radial + tangential model only, starting from pos.
 */
template<typename Pos_T, typename C_T>
Eigen::Matrix<Pos_T, 2, 1> invertDistortion(Eigen::Matrix<Pos_T, 2, 1> const& pos,
											DistortionCoefficients<C_T> const& coefs,
											int iters = 5) {

	static_assert (std::is_floating_point_v<Pos_T> and std::is_floating_point_v<C_T>,
			"The position and coefficients type should be float point types");

	Eigen::Matrix<Pos_T, 2, 1> npos = pos;

	for (int i = 0; i < iters; i++) {

		Eigen::Matrix<Pos_T, 2, 1> f = distortNormalizedViewPosition(npos, coefs) - pos;
		Eigen::Matrix<Pos_T, 2, 2> df = distortionJacobian(npos, coefs);

		Pos_T det = df.determinant();

		if (det == 0) { //stationary point, cannot progress further
			break;
		}

		npos = npos - df.inverse()*f;

	}

	return npos;

}

} // namespace Geometry
} // namespace LensMap

#endif // LENSMAP_LENSDISTORTION_H
