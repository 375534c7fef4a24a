#ifndef LENSMAP_DISPLACEMENTMAP_IO_H
#define LENSMAP_DISPLACEMENTMAP_IO_H

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

#include <string>
#include <cstdint>

namespace LensMap {
namespace IO {

/*!
 * \brief writeDisplacementMap write a four channels displacement map, in full float precision for the .lmimg extension.
 */
bool writeDisplacementMap(std::string const& fileName, DisplacementMap const& map);

/*!
 * \brief readDisplacementMap read a displacement map.
 * \return the map, or an empty array if the file could not be read or does not have four channels.
 */
DisplacementMap readDisplacementMap(std::string const& fileName);

/*!
 * \brief displacementMapPreview render a pair of channels of a displacement map as an 8 bit RGB image.
 * \param map the displacement map, expected to be already mapped to [0, 1] by the output transform.
 * \param firstChannel 0 for the distort to undistort channels, 2 for the undistort to distort channels.
 */
Multidim::Array<uint8_t, 3> displacementMapPreview(DisplacementMap const& map, int firstChannel = 0);

} // namespace IO
} // namespace LensMap

#endif // LENSMAP_DISPLACEMENTMAP_IO_H
