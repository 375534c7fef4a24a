#ifndef LENSMAP_GLOBAL_H
#define LENSMAP_GLOBAL_H

#include <MultidimArrays/MultidimArrays.h>

namespace LensMap {

/*!
 * \brief DisplacementMap is a height x width x 4 array.
 *
 * Channels 0 and 1 hold the distorted UV to undistorted UV displacement,
 * channels 2 and 3 the undistorted UV to distorted UV displacement.
 */
typedef Multidim::Array<float, 3> DisplacementMap;

typedef Multidim::Array<bool, 2> CoverageMask;

} // namespace LensMap

#endif // LENSMAP_GLOBAL_H
