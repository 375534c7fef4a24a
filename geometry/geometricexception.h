#ifndef LENSMAP_GEOMETRICEXCEPTION_H
#define LENSMAP_GEOMETRICEXCEPTION_H

#include <string>
#include <exception>

namespace LensMap {
namespace Geometry {

/*!
 * \brief The GeometricException class is raised when a lens or camera configuration cannot be turned into a valid mapping.
 */
class GeometricException : public std::exception
{
public:
	GeometricException(std::string const& what);
	GeometricException(GeometricException const& other);

	virtual ~GeometricException();

	const char* what() const noexcept override;

protected:

	std::string _what;
};

} // namespace Geometry
} // namespace LensMap

#endif // LENSMAP_GEOMETRICEXCEPTION_H
