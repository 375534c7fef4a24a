#include <iostream>
#include <sstream>
#include <vector>

#include <tclap/CmdLine.h>

#include "geometry/geometricexception.h"
#include "geometry/lenscameramodel.h"
#include "interpolation/displacementmapparameters.h"
#include "interpolation/lensdistortionsmap.h"
#include "io/displacementmap_io.h"
#include "io/image_io.h"
#include "utils/lensmapmath.h"

using namespace LensMap;

bool parseCameraMatrix(std::string const& str, Geometry::CameraMatrix<float> & out) {

	std::stringstream strs(str);
	std::vector<float> vals;

	std::string token;
	while (std::getline(strs, token, ',')) {
		try {
			vals.push_back(std::stof(token));
		} catch (std::logic_error const& e) {
			return false;
		}
	}

	if (vals.size() != 4) {
		return false;
	}

	out = Geometry::CameraMatrix<float>(vals[0], vals[1], vals[2], vals[3]);
	return true;
}

int main(int argc, char** argv) {

	std::string outFile;
	std::string previewFile;

	int width;
	int height;

	float k1, k2, k3, p1, p2;

	std::string undistortedMatrixStr;
	std::string distortedMatrixStr;

	bool useCameraModel;
	float hfov;
	float aspect;
	float fx, fy, cx, cy;
	std::string overscanStr;

	int gridX;
	int gridY;

	float multiply;
	float add;

	std::string uncoveredStr;

	try {
		TCLAP::CmdLine cmd("Compute the displacement map of a radial + tangential lens distortion model", '=', "0.0");

		TCLAP::UnlabeledValueArg<std::string> outFileArg("output", "Path where the displacement map is written (.lmimg for full precision)", true, "", "local path to output file");

		TCLAP::ValueArg<int> widthArg("", "width", "Width of the displacement map", false, 512, "pixels");
		TCLAP::ValueArg<int> heightArg("", "height", "Height of the displacement map", false, 512, "pixels");

		TCLAP::ValueArg<float> k1Arg("", "k1", "First radial distortion coefficient", false, 0, "float");
		TCLAP::ValueArg<float> k2Arg("", "k2", "Second radial distortion coefficient", false, 0, "float");
		TCLAP::ValueArg<float> k3Arg("", "k3", "Third radial distortion coefficient", false, 0, "float");
		TCLAP::ValueArg<float> p1Arg("", "p1", "First tangential distortion coefficient", false, 0, "float");
		TCLAP::ValueArg<float> p2Arg("", "p2", "Second tangential distortion coefficient", false, 0, "float");

		TCLAP::ValueArg<std::string> undistortedMatrixArg("", "undistorted", "Undistorted camera matrix", false, "1,1,0,0", "fx,fy,cx,cy");
		TCLAP::ValueArg<std::string> distortedMatrixArg("", "distorted", "Distorted camera matrix", false, "1,1,0,0", "fx,fy,cx,cy");

		TCLAP::ValueArg<float> hfovArg("", "hfov", "Horizontal field of view of the distorted camera, compile the camera matrices from the lens model when set", false, 0, "degrees");
		TCLAP::ValueArg<float> aspectArg("", "aspect", "Aspect ratio of the distorted viewport (defaults to width/height)", false, 0, "float");
		TCLAP::ValueArg<float> fxArg("", "fx", "Lens focal x, normalized by the viewport width", false, 1, "float");
		TCLAP::ValueArg<float> fyArg("", "fy", "Lens focal y, normalized by the viewport width", false, 1, "float");
		TCLAP::ValueArg<float> cxArg("", "cx", "Lens principal point x, in viewport UV", false, 0.5, "float");
		TCLAP::ValueArg<float> cyArg("", "cy", "Lens principal point y, in viewport UV", false, 0.5, "float");
		TCLAP::ValueArg<std::string> overscanArg("", "overscan", "Undistorted viewport overscan factor", false, "auto", "float or auto");

		TCLAP::ValueArg<int> gridXArg("", "gridx", "Grid subdivision along x", false, Interpolation::DisplacementMapParameters::defaultGridSubdivisionX, "cells");
		TCLAP::ValueArg<int> gridYArg("", "gridy", "Grid subdivision along y", false, Interpolation::DisplacementMapParameters::defaultGridSubdivisionY, "cells");

		TCLAP::ValueArg<float> multiplyArg("", "multiply", "Scale applied to the output channels", false, 1, "float");
		TCLAP::ValueArg<float> addArg("", "add", "Offset applied to the output channels", false, 0, "float");

		std::vector<std::string> policies = {"newton", "zero", "nan"};
		TCLAP::ValuesConstraint<std::string> policiesConstraint(policies);
		TCLAP::ValueArg<std::string> uncoveredArg("", "uncovered", "Filling of the pixels the undistorted grid does not reach", false, "newton", &policiesConstraint);

		TCLAP::ValueArg<std::string> previewArg("", "preview", "Path of an 8 bit preview of the distort to undistort channels", false, "", "local path to image file");

		cmd.add(outFileArg);
		cmd.add(widthArg);
		cmd.add(heightArg);
		cmd.add(k1Arg);
		cmd.add(k2Arg);
		cmd.add(k3Arg);
		cmd.add(p1Arg);
		cmd.add(p2Arg);
		cmd.add(undistortedMatrixArg);
		cmd.add(distortedMatrixArg);
		cmd.add(hfovArg);
		cmd.add(aspectArg);
		cmd.add(fxArg);
		cmd.add(fyArg);
		cmd.add(cxArg);
		cmd.add(cyArg);
		cmd.add(overscanArg);
		cmd.add(gridXArg);
		cmd.add(gridYArg);
		cmd.add(multiplyArg);
		cmd.add(addArg);
		cmd.add(uncoveredArg);
		cmd.add(previewArg);

		cmd.parse(argc, argv);

		outFile = outFileArg.getValue();
		previewFile = previewArg.getValue();

		width = widthArg.getValue();
		height = heightArg.getValue();

		k1 = k1Arg.getValue();
		k2 = k2Arg.getValue();
		k3 = k3Arg.getValue();
		p1 = p1Arg.getValue();
		p2 = p2Arg.getValue();

		undistortedMatrixStr = undistortedMatrixArg.getValue();
		distortedMatrixStr = distortedMatrixArg.getValue();

		useCameraModel = hfovArg.isSet();
		hfov = hfovArg.getValue();
		aspect = (aspectArg.isSet()) ? aspectArg.getValue() : static_cast<float>(width)/static_cast<float>(height);
		fx = fxArg.getValue();
		fy = fyArg.getValue();
		cx = cxArg.getValue();
		cy = cyArg.getValue();
		overscanStr = overscanArg.getValue();

		gridX = gridXArg.getValue();
		gridY = gridYArg.getValue();

		multiply = multiplyArg.getValue();
		add = addArg.getValue();

		uncoveredStr = uncoveredArg.getValue();

	} catch (TCLAP::ArgException &e) {
		std::cerr << "Argument error:" << e.error().c_str() << " for arg " << e.argId().c_str() << std::endl;
		return -1;
	}

	Geometry::DistortionCoefficients<float> coefs(k1, k2, k3, p1, p2);

	Interpolation::DisplacementMapParameters parameters(width, height);

	try {

		if (useCameraModel) {

			Geometry::LensCameraModel model(Eigen::Vector2f(fx, fy), Eigen::Vector2f(cx, cy), coefs);

			float hfovRad = Math::deg2rad(hfov);
			float overscan;

			if (overscanStr == "auto") {
				overscan = model.undistortOverscanFactor(hfovRad, aspect);
			} else {
				try {
					overscan = std::stof(overscanStr);
				} catch (std::logic_error const& e) {
					std::cerr << "Invalid overscan factor \"" << overscanStr << "\"" << std::endl;
					return -1;
				}
			}

			std::cout << "Undistorted viewport overscan factor: " << overscan << std::endl;

			parameters = Interpolation::compileCameraModel(model, hfovRad, aspect, overscan, width, height, multiply, add);

		} else {

			if (!parseCameraMatrix(undistortedMatrixStr, parameters.undistortedCamera)) {
				std::cerr << "Invalid undistorted camera matrix \"" << undistortedMatrixStr << "\", expected fx,fy,cx,cy" << std::endl;
				return -1;
			}

			if (!parseCameraMatrix(distortedMatrixStr, parameters.distortedCamera)) {
				std::cerr << "Invalid distorted camera matrix \"" << distortedMatrixStr << "\", expected fx,fy,cx,cy" << std::endl;
				return -1;
			}

			parameters.coefficients = coefs;
			parameters.outputMultiplyAndAdd = Eigen::Vector2f(multiply, add);
		}

		parameters.gridSubdivision = Eigen::Vector2i(gridX, gridY);

		if (uncoveredStr == "zero") {
			parameters.uncoveredPixelsPolicy = Interpolation::UncoveredPixelsPolicy::ZeroDisplacement;
		} else if (uncoveredStr == "nan") {
			parameters.uncoveredPixelsPolicy = Interpolation::UncoveredPixelsPolicy::NotANumber;
		} else {
			parameters.uncoveredPixelsPolicy = Interpolation::UncoveredPixelsPolicy::NewtonInverse;
		}

		parameters.validate();

	} catch (Geometry::GeometricException const& e) {
		std::cerr << "Invalid lens configuration: " << e.what() << std::endl;
		return -1;
	}

	std::cout << "Displacement map " << parameters.width << "x" << parameters.height
			  << ", grid " << parameters.gridSubdivision.x() << "x" << parameters.gridSubdivision.y() << std::endl;
	std::cout << "\t" << "k123: " << parameters.coefficients.k123.transpose() << std::endl;
	std::cout << "\t" << "p12: " << parameters.coefficients.p12.transpose() << std::endl;
	std::cout << "\t" << "Undistorted camera matrix: " << parameters.undistortedCamera.toVector().transpose() << std::endl;
	std::cout << "\t" << "Distorted camera matrix: " << parameters.distortedCamera.toVector().transpose() << std::endl;
	std::cout << "\t" << "Output multiply and add: " << parameters.outputMultiplyAndAdd.transpose() << std::endl;

	CoverageMask coverage;
	DisplacementMap map = Interpolation::computeLensDisplacementMap(parameters, coverage);

	int nCovered = 0;
	for (int i = 0; i < coverage.shape()[0]; i++) {
		for (int j = 0; j < coverage.shape()[1]; j++) {
			if (coverage.value<Multidim::AccessCheck::Nocheck>(i,j)) {
				nCovered++;
			}
		}
	}

	int nPixels = parameters.width*parameters.height;
	std::cout << "Pixels covered by the undistorted grid: " << nCovered << "/" << nPixels << std::endl;

	bool ok = IO::writeDisplacementMap(outFile, map);

	if (!ok) {
		std::cerr << "Failed to write displacement map to \"" << outFile << "\"" << std::endl;
		return -1;
	}

	std::cout << "Displacement map written to \"" << outFile << "\"" << std::endl;

	if (!previewFile.empty()) {

		Multidim::Array<uint8_t, 3> preview = IO::displacementMapPreview(map, 0);

		ok = IO::writeImage<uint8_t>(previewFile, preview);

		if (!ok) {
			std::cerr << "Failed to write preview to \"" << previewFile << "\"" << std::endl;
			return -1;
		}

		std::cout << "Preview written to \"" << previewFile << "\"" << std::endl;
	}

	return 0;
}
