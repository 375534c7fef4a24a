#ifndef LENSMAP_MATH_H
#define LENSMAP_MATH_H

#include <cmath>

namespace LensMap {
namespace Math {

template<typename T>
inline T deg2rad(T deg) {
	return deg*static_cast<T>(M_PI)/T(180);
}

}
}

#endif // LENSMAP_MATH_H
