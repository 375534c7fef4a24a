#ifndef LENSMAP_IMAGE_IO_H
#define LENSMAP_IMAGE_IO_H

#define cimg_display 0 //no display from Cimg

#ifdef LENSMAP_IO_USE_PNG
#define cimg_use_png //use png image format
#endif //LENSMAP_IO_USE_PNG

#ifdef LENSMAP_IO_USE_TIFF
#define cimg_use_tiff //use tiff image format
#define cimg_use_tif
#endif //LENSMAP_IO_USE_TIFF

#include <CImg.h>

#include "../utils/types_manipulations.h"

#include <MultidimArrays/MultidimArrays.h>

#include <string>
#include <sstream>
#include <fstream>
#include <vector>
#include <algorithm>
#include <cstdio>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <limits>

namespace LensMap {
namespace IO {

inline bool hasLmimgExtension(std::string const& fileName) {
	std::string lmimg_ext = ".lmimg";
	return fileName.size() >= lmimg_ext.size() and 0 == fileName.compare(fileName.size()-lmimg_ext.size(), lmimg_ext.size(), lmimg_ext);
}

inline bool hostIsLittleEndian() {
	const uint16_t one = 1;
	unsigned char firstByte;
	std::memcpy(&firstByte, &one, 1);
	return firstByte == 1;
}

/*!
 * \brief swapBytes reverse the byte order of each of the n values pointed to by data.
 */
template<typename T>
void swapBytes(T* data, size_t n) {
	static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
	for (size_t i = 0; i < n; i++) {
		unsigned char* bytes = reinterpret_cast<unsigned char*>(data + i);
		std::reverse(bytes, bytes + sizeof (T));
	}
}

/*!
 * \brief writeLmimg write an array in the native .lmimg format.
 *
 * The file starts with a text header line "dtype nDim shape... strides...",
 * followed by the dense row major data in little endian byte order.
 */
template<typename ImgType, typename InType, int nDim>
bool writeLmimg(std::string const& fileName, Multidim::Array<InType, nDim> const& image) {

	constexpr Multidim::AccessCheck Nc = Multidim::AccessCheck::Nocheck;

	typename Multidim::Array<ImgType, nDim>::ShapeBlock strides;
	bool rowMajor = true;
	int denseStride = 1;

	for (int i = nDim-1; i >= 0; i--) {
		strides[i] = denseStride;
		rowMajor = rowMajor and (image.shape()[i] == 1 or image.strides()[i] == denseStride);
		denseStride *= image.shape()[i];
	}

	if (!std::is_same_v<ImgType, InType> or (!rowMajor and !image.empty())) {
		Multidim::Array<ImgType, nDim> converted(image.shape(), strides);

		typename Multidim::Array<ImgType, nDim>::IndexBlock idx;
		idx.setZero();

		for (int i = 0; i < image.flatLenght(); i++) {
			converted.template at<Nc>(idx) = static_cast<ImgType>(image.template value<Nc>(idx));
			idx.moveToNextIndex(image.shape());
		}

		return writeLmimg<ImgType, ImgType, nDim>(fileName, converted);
	}

	std::FILE* outfile = std::fopen(fileName.c_str(), "wb");

	if (outfile) {

		std::stringstream strs;

		//data type and number of dimensions, then shape and strides
		strs << TypesManipulations::dtypeDescr<ImgType>() << ' ' << nDim;
		for (int i = 0; i < nDim; i++) {
			strs << ' ' << image.shape()[i];
		}
		for (int i = 0; i < nDim; i++) {
			strs << ' ' << strides[i];
		}
		strs << '\n';

		std::string str = strs.str();

		bool ok = true;
		ok = ok and std::fwrite(str.c_str(), sizeof (char), str.length(), outfile) == str.length();

		if (image.flatLenght() > 0) {

			ImgType const* data = &const_cast<Multidim::Array<InType, nDim>*>(&image)->atUnchecked(0);
			size_t nValues = static_cast<size_t>(image.flatLenght());

			if (hostIsLittleEndian() or sizeof (ImgType) == 1) {
				ok = ok and std::fwrite(data, sizeof (ImgType), nValues, outfile) == nValues;
			} else {
				std::vector<ImgType> swapped(data, data + nValues);
				swapBytes(swapped.data(), nValues);
				ok = ok and std::fwrite(swapped.data(), sizeof (ImgType), nValues, outfile) == nValues;
			}
		}

		ok = std::fclose(outfile) == 0 and ok;

		return ok;

	} else {
		errno = 0; //reset the error
		return false;
	}

}

template<typename ImgType, int nDim>
Multidim::Array<ImgType, nDim> readLmimg(std::string const& fileName) {

	std::ifstream infile;
	infile.open(fileName, std::ios_base::in | std::ios_base::binary);

	if (!infile.is_open()) {
		return Multidim::Array<ImgType, nDim>();
	}

	std::string line;
	getline( infile, line );

	std::stringstream strs;
	strs.str(line);

	std::string type;
	strs >> type;

	if (type != TypesManipulations::dtypeDescr<ImgType>()) {
		return Multidim::Array<ImgType, nDim>();
	}

	int nDimInFile;
	strs >> nDimInFile;

	if (!strs or nDimInFile > nDim or nDimInFile <= 0) {
		return Multidim::Array<ImgType, nDim>();
	}

	typename Multidim::Array<ImgType, nDim>::ShapeBlock shape;
	typename Multidim::Array<ImgType, nDim>::ShapeBlock stride;

	for (int i = 0; i < nDim; i++) {
		if (i < nDimInFile) {
			strs >> shape[i];
		} else {
			shape[i] = 1;
		}
	}

	for (int i = 0; i < nDimInFile; i++) {
		strs >> stride[i];
	}

	if (!strs) {
		return Multidim::Array<ImgType, nDim>();
	}

	int64_t flatLength = 1;

	for (int i = 0; i < nDim; i++) {
		if (shape[i] <= 0) {
			return Multidim::Array<ImgType, nDim>();
		}

		flatLength *= shape[i];

		if (flatLength > std::numeric_limits<int>::max()) {
			return Multidim::Array<ImgType, nDim>();
		}
	}

	//only dense row major data blocks are accepted
	int denseStride = 1;

	for (int i = nDim-1; i >= 0; i--) {
		if (i < nDimInFile and stride[i] != denseStride) {
			return Multidim::Array<ImgType, nDim>();
		}
		stride[i] = denseStride;
		denseStride *= shape[i];
	}

	Multidim::Array<ImgType, nDim> img(shape, stride);

	if (img.flatLenght() > 0) {
		infile.read(reinterpret_cast<char*>(&img.atUnchecked(0)), sizeof (ImgType) * img.flatLenght());

		if (!infile) { //truncated file
			return Multidim::Array<ImgType, nDim>();
		}

		if (!hostIsLittleEndian() and sizeof (ImgType) > 1) {
			swapBytes(&img.atUnchecked(0), static_cast<size_t>(img.flatLenght()));
		}
	}

	return img;

}

/*!
 * \brief readImage read an image, as a height x width x channels array.
 * \return the image, or an empty array if the file could not be read.
 *
 * The .lmimg extension is read natively, any other format is delegated to CImg.
 */
template<typename ImgType>
Multidim::Array<ImgType, 3> readImage(std::string const& fileName);

/*!
 * \brief writeImage write a height x width x channels array to disk.
 * \return true on success.
 *
 * The .lmimg extension is written natively, any other format is delegated to CImg.
 */
template<typename ImgType, typename InType>
bool writeImage(std::string const& fileName, Multidim::Array<InType, 3> const& image);

/*!
 * \brief writeImage write a height x width boolean mask to disk.
 *
 * In .lmimg files the mask is stored as 0 and 1, other formats receive black and white levels.
 */
template<typename ImgType, typename InType>
bool writeImage(std::string const& fileName, Multidim::Array<InType, 2> const& image);

} //namespace IO
} //namespace LensMap

#endif // LENSMAP_IMAGE_IO_H
