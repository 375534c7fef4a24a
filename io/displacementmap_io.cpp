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

#include "displacementmap_io.h"

#include "image_io.h"

#include <algorithm>
#include <cmath>

namespace LensMap {
namespace IO {

bool writeDisplacementMap(std::string const& fileName, DisplacementMap const& map) {

	if (map.empty() or map.shape()[2] != 4) {
		return false;
	}

	return writeImage<float, float>(fileName, map);
}

DisplacementMap readDisplacementMap(std::string const& fileName) {

	DisplacementMap map = readImage<float>(fileName);

	if (map.empty() or map.shape()[2] != 4) {
		return DisplacementMap();
	}

	return map;
}

Multidim::Array<uint8_t, 3> displacementMapPreview(DisplacementMap const& map, int firstChannel) {

	constexpr Multidim::AccessCheck Nc = Multidim::AccessCheck::Nocheck;

	if (map.empty() or firstChannel < 0 or firstChannel+1 >= map.shape()[2]) {
		return Multidim::Array<uint8_t, 3>();
	}

	int height = map.shape()[0];
	int width = map.shape()[1];

	Multidim::Array<uint8_t, 3> preview(height, width, 3);

	for (int i = 0; i < height; i++) {
		for (int j = 0; j < width; j++) {
			for (int c = 0; c < 2; c++) {
				float val = map.value<Nc>(i,j,firstChannel+c);

				if (!std::isfinite(val)) {
					val = 0;
				}

				preview.at<Nc>(i,j,c) = static_cast<uint8_t>(std::round(255.f*std::clamp(val, 0.f, 1.f)));
			}
			preview.at<Nc>(i,j,2) = 0;
		}
	}

	return preview;
}

} // namespace IO
} // namespace LensMap
