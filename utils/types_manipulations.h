#ifndef LENSMAP_TYPES_MANIPULATIONS_H
#define LENSMAP_TYPES_MANIPULATIONS_H

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

#include <cstdint>
#include <type_traits>
#include <limits>

namespace LensMap {

namespace TypesManipulations {

template <class T>
/*!
 * \brief dtypeDescr give the name of a type, as written in the header of native image files.
 */
inline constexpr const char* dtypeDescr() {

	if (std::is_same_v<T, bool>) {
		return "bool";
	}

	if (std::is_floating_point_v<T>) {
		return (sizeof (T) == 4) ? "float32" : "float64";
	}

	if (std::is_signed_v<T>) {
		switch (sizeof (T)) {
		case 1:
			return "int8";
		case 2:
			return "int16";
		case 4:
			return "int32";
		default:
			return "int64";
		}
	}

	switch (sizeof (T)) {
	case 1:
		return "uint8";
	case 2:
		return "uint16";
	case 4:
		return "uint32";
	default:
		return "uint64";
	}
}

template <class T>
inline constexpr T defaultWhiteLevel() {
	if (std::is_integral_v<T>) {
		return std::numeric_limits<T>::max();
	}
	return 1;
}

template <class T>
inline constexpr T defaultBlackLevel() {
	return 0;
}

} // namespace TypesManipulations

} // namespace LensMap

#endif // LENSMAP_TYPES_MANIPULATIONS_H
