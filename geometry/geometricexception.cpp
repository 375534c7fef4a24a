#include "geometricexception.h"

namespace LensMap {
namespace Geometry {

GeometricException::GeometricException(std::string const& what) :
	_what(what)
{

}

GeometricException::GeometricException(GeometricException const& other) :
	GeometricException(other._what)
{

}

GeometricException::~GeometricException() {

}

const char* GeometricException::what() const noexcept
{
	return _what.c_str();
}

} // namespace Geometry
} // namespace LensMap
