#include <QtTest/QtTest>

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

#include "io/image_io.h"
#include "io/displacementmap_io.h"

#include <MultidimArrays/MultidimArrays.h>

#include <random>
#include <limits>
#include <vector>
#include <fstream>

class TestImageIO: public QObject
{

	Q_OBJECT

private Q_SLOTS:

	void initTestCase();

	void testLmimgSaving_data();
	void testLmimgSaving();

	void testMaskSaving();

	void testDisplacementMapSaving();

	void testInvalidFiles();

	void testLittleEndianData();

	void testBmpSaving();

	void testPreview();

private:
	std::default_random_engine re;

	std::string tmpFilePath(QString const& filename) {
		QString filepath = QDir::current().filePath(filename);

		QFile f(filepath);
		if (f.exists()) {
			f.remove(); //remove the file, in case it already exist.
		}

		return filepath.toStdString();
	}

	template<typename T>
	void testLmimgSavingImpl(int w, int h, int channels) {

		T maxVal = 0xFF;
		if (std::is_same_v<T, uint16_t>) {
			maxVal = static_cast<T>(0xFFFF);
		}

		std::uniform_int_distribution<uint32_t> idist(0,maxVal);
		std::uniform_real_distribution<float> fdist(-1,1);

		Multidim::Array<T,3> img(h,w,channels);

		for (int i = 0; i < h; i++) {
			for (int j = 0; j < w; j++) {
				for (int c = 0; c < channels; c++) {
					T val = (std::is_integral_v<T>) ? static_cast<T>(idist(re)) : static_cast<T>(fdist(re));
					img.atUnchecked(i,j,c) = val;
				}
			}
		}

		QString formatInfo = QString("%1%2").arg(((std::is_integral_v<T>) ? "i" : "f")).arg(sizeof (T)*8);
		QString filename = QString("%1_%2_%3_%4.%5").arg(w).arg(h).arg(channels).arg(formatInfo).arg("lmimg");
		std::string fname = tmpFilePath(filename);

		bool ok = LensMap::IO::writeImage<T,T>(fname,img);

		QVERIFY2(ok, "Failed to write image to disk");

		Multidim::Array<T, 3> reloaded = LensMap::IO::readImage<T>(fname);

		QVERIFY(img.shape() == reloaded.shape());

		for (int i = 0; i < img.shape()[0]; i++) {
			for (int j = 0; j < img.shape()[1]; j++) {
				for (int c = 0; c < img.shape()[2]; c++) {
					QCOMPARE(img.atUnchecked(i,j,c), reloaded.atUnchecked(i,j,c));
				}
			}
		}

		//wrong data type
		if (std::is_same_v<T, float>) {
			QVERIFY(LensMap::IO::readImage<uint8_t>(fname).empty());
		} else {
			QVERIFY(LensMap::IO::readImage<float>(fname).empty());
		}

	}

};

void TestImageIO::initTestCase() {
	std::random_device rd;
	re.seed(rd());
}

void TestImageIO::testLmimgSaving_data() {

	QTest::addColumn<int>("w");
	QTest::addColumn<int>("h");
	QTest::addColumn<int>("channels");
	QTest::addColumn<int>("bitdepth");
	QTest::addColumn<bool>("floating_point");

	QTest::newRow("SD 8bit lmimg rgb") << 640 << 480 << 3 << 8 << false;
	QTest::newRow("SD 16bit lmimg grayscale") << 640 << 480 << 1 << 16 << false;
	QTest::newRow("SD float lmimg displacement") << 640 << 480 << 4 << 32 << true;
	QTest::newRow("HD float lmimg displacement") << 1920 << 1080 << 4 << 32 << true;
	QTest::newRow("Odd float lmimg") << 97 << 61 << 7 << 32 << true;

}
void TestImageIO::testLmimgSaving() {

	QFETCH(int, w);
	QFETCH(int, h);
	QFETCH(int, channels);
	QFETCH(int, bitdepth);
	QFETCH(bool, floating_point);

	if (floating_point == false) {
		if (bitdepth != 8 and bitdepth != 16) {
			QSKIP("Invalid bit depth provided for integer precision image");
		}

		if (bitdepth == 8) {
			testLmimgSavingImpl<uint8_t>(w, h, channels);
		}

		if (bitdepth == 16) {
			testLmimgSavingImpl<uint16_t>(w, h, channels);
		}

	} else {

		if (bitdepth != 32) {
			QSKIP("Invalid bit depth provided for floating point precision image");
		}

		testLmimgSavingImpl<float>(w, h, channels);
	}

}

void TestImageIO::testMaskSaving() {

	std::string fname = tmpFilePath("coverage_mask.lmimg");

	Multidim::Array<bool, 2> mask(13, 21);

	for (int i = 0; i < 13; i++) {
		for (int j = 0; j < 21; j++) {
			mask.atUnchecked(i,j) = (i+j)%3 == 0;
		}
	}

	bool ok = LensMap::IO::writeImage<uint8_t, bool>(fname, mask);
	QVERIFY2(ok, "Failed to write mask to disk");

	//a two dimensional file is read back with a single channel
	Multidim::Array<uint8_t, 3> reloaded = LensMap::IO::readImage<uint8_t>(fname);

	QCOMPARE(reloaded.shape()[0], 13);
	QCOMPARE(reloaded.shape()[1], 21);
	QCOMPARE(reloaded.shape()[2], 1);

	for (int i = 0; i < 13; i++) {
		for (int j = 0; j < 21; j++) {
			QCOMPARE(reloaded.valueUnchecked(i,j,0), static_cast<uint8_t>(mask.valueUnchecked(i,j)));
		}
	}
}

void TestImageIO::testDisplacementMapSaving() {

	std::string fname = tmpFilePath("displacement_map.lmimg");

	LensMap::DisplacementMap map(24, 32, 4);

	std::uniform_real_distribution<float> fdist(-0.1, 0.1);

	for (int i = 0; i < 24; i++) {
		for (int j = 0; j < 32; j++) {
			for (int c = 0; c < 4; c++) {
				map.atUnchecked(i,j,c) = fdist(re);
			}
		}
	}

	//uncovered pixels written as NaN survive the round trip
	map.atUnchecked(0,0,2) = std::numeric_limits<float>::quiet_NaN();

	QVERIFY(LensMap::IO::writeDisplacementMap(fname, map));

	LensMap::DisplacementMap reloaded = LensMap::IO::readDisplacementMap(fname);

	QVERIFY(map.shape() == reloaded.shape());

	QVERIFY(std::isnan(reloaded.valueUnchecked(0,0,2)));

	for (int i = 0; i < 24; i++) {
		for (int j = 0; j < 32; j++) {
			for (int c = 0; c < 4; c++) {
				if (i == 0 and j == 0 and c == 2) {
					continue;
				}
				QCOMPARE(reloaded.valueUnchecked(i,j,c), map.valueUnchecked(i,j,c));
			}
		}
	}

	//not a displacement map
	std::string wrongChannels = tmpFilePath("three_channels.lmimg");
	Multidim::Array<float, 3> rgb(8, 8, 3);

	QVERIFY(!LensMap::IO::writeDisplacementMap(wrongChannels, rgb));
	QVERIFY(LensMap::IO::writeImage<float, float>(wrongChannels, rgb));
	QVERIFY(LensMap::IO::readDisplacementMap(wrongChannels).empty());
}

void TestImageIO::testInvalidFiles() {

	std::string missing = tmpFilePath("missing_file.lmimg");
	QVERIFY(LensMap::IO::readImage<float>(missing).empty());

	std::string truncatedPath = tmpFilePath("truncated.lmimg");

	{
		std::ofstream truncated(truncatedPath, std::ios_base::out | std::ios_base::binary);
		truncated << "float32 3 4 4 4 16 4 1\n";
		float val = 1;
		truncated.write(reinterpret_cast<char*>(&val), sizeof (float));
	}

	QVERIFY(LensMap::IO::readImage<float>(truncatedPath).empty());

	std::string garbagePath = tmpFilePath("garbage.lmimg");

	{
		std::ofstream garbage(garbagePath, std::ios_base::out | std::ios_base::binary);
		garbage << "float32 lorem ipsum\n";
	}

	QVERIFY(LensMap::IO::readImage<float>(garbagePath).empty());

	auto writeHeaderAndData = [this] (QString const& name, const char* header, int nFloats) {
		std::string path = tmpFilePath(name);
		std::ofstream file(path, std::ios_base::out | std::ios_base::binary);
		file << header;
		std::vector<float> data(nFloats, 1.f);
		file.write(reinterpret_cast<char*>(data.data()), sizeof (float)*data.size());
		return path;
	};

	std::string negativeShapePath = writeHeaderAndData("negative_shape.lmimg", "float32 3 -4 4 4 16 4 1\n", 64);
	QVERIFY(LensMap::IO::readImage<float>(negativeShapePath).empty());

	std::string zeroShapePath = writeHeaderAndData("zero_shape.lmimg", "float32 3 4 0 4 0 4 1\n", 64);
	QVERIFY(LensMap::IO::readImage<float>(zeroShapePath).empty());

	std::string sparseStridesPath = writeHeaderAndData("sparse_strides.lmimg", "float32 3 2 2 4 100 4 1\n", 16);
	QVERIFY(LensMap::IO::readImage<float>(sparseStridesPath).empty());

	std::string columnMajorPath = writeHeaderAndData("column_major.lmimg", "float32 3 2 2 4 1 2 4\n", 16);
	QVERIFY(LensMap::IO::readImage<float>(columnMajorPath).empty());

	std::string hugeShapePath = writeHeaderAndData("huge_shape.lmimg", "float32 3 65536 65536 4 262144 4 1\n", 16);
	QVERIFY(LensMap::IO::readImage<float>(hugeShapePath).empty());

	//the same block with a valid header is accepted
	std::string validPath = writeHeaderAndData("valid_header.lmimg", "float32 3 2 2 4 8 4 1\n", 16);
	Multidim::Array<float, 3> valid = LensMap::IO::readImage<float>(validPath);
	QCOMPARE(valid.shape()[0], 2);
	QCOMPARE(valid.shape()[1], 2);
	QCOMPARE(valid.shape()[2], 4);
	QCOMPARE(valid.valueUnchecked(1,1,3), 1.f);

	QVERIFY(!LensMap::IO::writeImage<float, float>(tmpFilePath("empty.lmimg"), Multidim::Array<float, 3>()));
}

void TestImageIO::testLittleEndianData() {

	std::string fname = tmpFilePath("byte_order.lmimg");

	Multidim::Array<uint16_t, 3> img(1, 2, 1);
	img.atUnchecked(0,0,0) = 0x0102;
	img.atUnchecked(0,1,0) = 0xA0B0;

	QVERIFY(LensMap::IO::writeImage<uint16_t, uint16_t>(fname, img));

	std::ifstream file(fname, std::ios_base::in | std::ios_base::binary);
	std::string header;
	std::getline(file, header);

	QCOMPARE(QString::fromStdString(header), QString("uint16 3 1 2 1 2 1 1"));

	unsigned char bytes[4];
	file.read(reinterpret_cast<char*>(bytes), 4);
	QVERIFY(file);

	//least significant byte first, whatever the host byte order
	QCOMPARE(bytes[0], static_cast<unsigned char>(0x02));
	QCOMPARE(bytes[1], static_cast<unsigned char>(0x01));
	QCOMPARE(bytes[2], static_cast<unsigned char>(0xB0));
	QCOMPARE(bytes[3], static_cast<unsigned char>(0xA0));

	Multidim::Array<uint16_t, 3> reloaded = LensMap::IO::readImage<uint16_t>(fname);
	QCOMPARE(reloaded.valueUnchecked(0,0,0), static_cast<uint16_t>(0x0102));
	QCOMPARE(reloaded.valueUnchecked(0,1,0), static_cast<uint16_t>(0xA0B0));
}

void TestImageIO::testBmpSaving() {

	std::string fname = tmpFilePath("preview_test.bmp");

	std::uniform_int_distribution<uint32_t> idist(0,255);

	Multidim::Array<uint8_t, 3> img(20, 30, 3);

	for (int i = 0; i < 20; i++) {
		for (int j = 0; j < 30; j++) {
			for (int c = 0; c < 3; c++) {
				img.atUnchecked(i,j,c) = static_cast<uint8_t>(idist(re));
			}
		}
	}

	bool ok = LensMap::IO::writeImage<uint8_t, uint8_t>(fname, img);
	QVERIFY2(ok, "Failed to write bmp image to disk");

	Multidim::Array<uint8_t, 3> reloaded = LensMap::IO::readImage<uint8_t>(fname);

	QVERIFY(img.shape() == reloaded.shape());

	for (int i = 0; i < 20; i++) {
		for (int j = 0; j < 30; j++) {
			for (int c = 0; c < 3; c++) {
				QCOMPARE(reloaded.valueUnchecked(i,j,c), img.valueUnchecked(i,j,c));
			}
		}
	}
}

void TestImageIO::testPreview() {

	LensMap::DisplacementMap map(2, 3, 4);

	for (int i = 0; i < 2; i++) {
		for (int j = 0; j < 3; j++) {
			for (int c = 0; c < 4; c++) {
				map.atUnchecked(i,j,c) = 0.5;
			}
		}
	}

	map.atUnchecked(0,0,0) = -1;
	map.atUnchecked(0,1,0) = 2;
	map.atUnchecked(0,2,1) = std::numeric_limits<float>::quiet_NaN();
	map.atUnchecked(1,0,2) = 1;

	Multidim::Array<uint8_t, 3> preview = LensMap::IO::displacementMapPreview(map);

	QCOMPARE(preview.shape()[0], 2);
	QCOMPARE(preview.shape()[1], 3);
	QCOMPARE(preview.shape()[2], 3);

	QCOMPARE(preview.valueUnchecked(0,0,0), uint8_t(0));
	QCOMPARE(preview.valueUnchecked(0,1,0), uint8_t(255));
	QCOMPARE(preview.valueUnchecked(0,2,1), uint8_t(0));
	QCOMPARE(preview.valueUnchecked(1,1,0), uint8_t(128));
	QCOMPARE(preview.valueUnchecked(1,1,2), uint8_t(0));

	Multidim::Array<uint8_t, 3> inversePreview = LensMap::IO::displacementMapPreview(map, 2);

	QCOMPARE(inversePreview.valueUnchecked(1,0,0), uint8_t(255));

	QVERIFY(LensMap::IO::displacementMapPreview(map, 3).empty());
}

QTEST_MAIN(TestImageIO)
#include "testImageIO.moc"
