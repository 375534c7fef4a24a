#include "image_io.h"

namespace LensMap {
namespace IO {

namespace {

/*!
 * \brief toCImg copy a height x width x channels array into the width first CImg layout.
 */
template<typename ImgType>
cimg_library::CImg<ImgType> toCImg(Multidim::Array<ImgType, 3> const& image) {

	constexpr Multidim::AccessCheck Nc = Multidim::AccessCheck::Nocheck;

	int height = image.shape()[0];
	int width = image.shape()[1];
	int channels = image.shape()[2];

	cimg_library::CImg<ImgType> img(width, height, 1, channels);

	for (int y = 0; y < height; y++) {
		for (int x = 0; x < width; x++) {
			for (int c = 0; c < channels; c++) {
				img(x,y,0,c) = image.template value<Nc>(y,x,c);
			}
		}
	}

	return img;
}

template<typename ImgType>
Multidim::Array<ImgType, 3> fromCImg(cimg_library::CImg<ImgType> const& img) {

	constexpr Multidim::AccessCheck Nc = Multidim::AccessCheck::Nocheck;

	Multidim::Array<ImgType, 3> image(img.height(), img.width(), img.spectrum());

	for (int y = 0; y < img.height(); y++) {
		for (int x = 0; x < img.width(); x++) {
			for (int c = 0; c < img.spectrum(); c++) {
				image.template at<Nc>(y,x,c) = img(x,y,0,c);
			}
		}
	}

	return image;
}

template<typename ImgType>
bool saveWithCImg(std::string const& fileName, Multidim::Array<ImgType, 3> const& image) {

	try {
		toCImg(image).save(fileName.c_str());
	} catch (cimg_library::CImgException const& e) {
		return false;
	}

	return true;
}

} //namespace

template<typename ImgType>
Multidim::Array<ImgType, 3> readImage(std::string const& fileName) {

	if (hasLmimgExtension(fileName)) {
		return readLmimg<ImgType, 3>(fileName);
	}

	try {
		cimg_library::CImg<ImgType> img(fileName.c_str());

		if (img.is_empty() or img.depth() != 1) { //volumes are not images
			return Multidim::Array<ImgType, 3>();
		}

		return fromCImg(img);

	} catch (cimg_library::CImgException const& e) {
		return Multidim::Array<ImgType, 3>();
	}
}

template<typename ImgType, typename InType>
bool writeImage(std::string const& fileName, Multidim::Array<InType, 3> const& image) {

	if (image.empty()) {
		return false;
	}

	if (hasLmimgExtension(fileName)) {
		return writeLmimg<ImgType, InType, 3>(fileName, image);
	}

	return saveWithCImg(fileName, image);
}

template<typename ImgType, typename InType>
bool writeImage(std::string const& fileName, Multidim::Array<InType, 2> const& image) {

	static_assert(std::is_same_v<InType, bool>, "Two dimensional arrays are written as masks");

	constexpr Multidim::AccessCheck Nc = Multidim::AccessCheck::Nocheck;

	if (image.empty()) {
		return false;
	}

	if (hasLmimgExtension(fileName)) {
		return writeLmimg<ImgType, InType, 2>(fileName, image);
	}

	//masks use the full range of the output type
	Multidim::Array<ImgType, 3> levels(image.shape()[0], image.shape()[1], 1);

	for (int i = 0; i < image.shape()[0]; i++) {
		for (int j = 0; j < image.shape()[1]; j++) {
			levels.template at<Nc>(i,j,0) = (image.template value<Nc>(i,j)) ?
						TypesManipulations::defaultWhiteLevel<ImgType>() :
						TypesManipulations::defaultBlackLevel<ImgType>();
		}
	}

	return saveWithCImg(fileName, levels);
}

//previews, coverage masks and displacement maps.
template Multidim::Array<uint8_t, 3> readImage<uint8_t>(std::string const& fileName);
template Multidim::Array<uint16_t, 3> readImage<uint16_t>(std::string const& fileName);
template Multidim::Array<float, 3> readImage<float>(std::string const& fileName);

template bool writeImage<uint8_t, uint8_t>(std::string const& fileName, Multidim::Array<uint8_t, 3> const& image);
template bool writeImage<uint16_t, uint16_t>(std::string const& fileName, Multidim::Array<uint16_t, 3> const& image);
template bool writeImage<float, float>(std::string const& fileName, Multidim::Array<float, 3> const& image);

template bool writeImage<uint8_t, bool>(std::string const& fileName, Multidim::Array<bool, 2> const& image);

} //namespace IO
} //namespace LensMap
