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

#include "interpolation/lensdistortionsmap.h"
#include "interpolation/displacementmapparameters.h"
#include "interpolation/distortiongrid.h"

Q_DECLARE_METATYPE(Eigen::Vector2i)

class BenchmarkDisplacementMap: public QObject
{

	Q_OBJECT

private Q_SLOTS:

	void benchmarkGridEvaluation_data();
	void benchmarkGridEvaluation();

	void benchmarkDisplacementMap_data();
	void benchmarkDisplacementMap();

private:

	LensMap::Interpolation::DisplacementMapParameters barrelParameters(int w, int h, Eigen::Vector2i const& grid) {
		LensMap::Interpolation::DisplacementMapParameters params(w, h);
		params.coefficients = LensMap::Geometry::DistortionCoefficients<float>(-0.12, 0.03, -0.002, 0.0005, -0.0003);
		params.undistortedCamera = LensMap::Geometry::CameraMatrix<float>(1, float(w)/h, 0.5, 0.5);
		params.distortedCamera = LensMap::Geometry::CameraMatrix<float>(1.05, 1.05*float(w)/h, 0.5, 0.5);
		params.gridSubdivision = grid;
		return params;
	}

};

void BenchmarkDisplacementMap::benchmarkGridEvaluation_data() {

	QTest::addColumn<Eigen::Vector2i>("grid");

	QTest::newRow("Default grid") << Eigen::Vector2i(32, 16);
	QTest::newRow("Fine grid") << Eigen::Vector2i(128, 64);
	QTest::newRow("Very fine grid") << Eigen::Vector2i(512, 256);
}
void BenchmarkDisplacementMap::benchmarkGridEvaluation() {

	QFETCH(Eigen::Vector2i, grid);

	LensMap::Interpolation::DisplacementMapParameters params = barrelParameters(1920, 1080, grid);

	LensMap::Interpolation::DistortionGrid distortionGrid(grid);
	LensMap::Geometry::LensViewportMapping mapping = params.mapping();

	std::vector<LensMap::Interpolation::GridVertex> vertices;

	QBENCHMARK_ONCE {
		vertices = distortionGrid.evaluateVertices(mapping, params.pixelUVSize());
	}

	QCOMPARE(static_cast<int>(vertices.size()), distortionGrid.nVertices());
}

void BenchmarkDisplacementMap::benchmarkDisplacementMap_data() {

	QTest::addColumn<int>("w");
	QTest::addColumn<int>("h");
	QTest::addColumn<Eigen::Vector2i>("grid");

	QTest::newRow("SD default grid") << 640 << 480 << Eigen::Vector2i(32, 16);
	QTest::newRow("HD default grid") << 1920 << 1080 << Eigen::Vector2i(32, 16);
	QTest::newRow("HD fine grid") << 1920 << 1080 << Eigen::Vector2i(128, 64);
	QTest::newRow("UHD default grid") << 3840 << 2160 << Eigen::Vector2i(32, 16);
}
void BenchmarkDisplacementMap::benchmarkDisplacementMap() {

	QFETCH(int, w);
	QFETCH(int, h);
	QFETCH(Eigen::Vector2i, grid);

	LensMap::Interpolation::DisplacementMapParameters params = barrelParameters(w, h, grid);

	LensMap::DisplacementMap map;

	QBENCHMARK_ONCE {
		map = LensMap::Interpolation::computeLensDisplacementMap(params);
	}

	QCOMPARE(map.shape()[0], h);
	QCOMPARE(map.shape()[1], w);
}

QTEST_MAIN(BenchmarkDisplacementMap)
#include "benchmarkDisplacementMap.moc"
