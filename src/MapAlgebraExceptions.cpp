#include"MapAlgebraExceptions.hpp"

namespace mapalg {
	DimensionMismatchException::DimensionMismatchException(const std::string& error) : std::runtime_error(error) {}
	InvalidExtentException::InvalidExtentException(const std::string& error) : std::runtime_error(error) {}
	OutsideExtentException::OutsideExtentException(const std::string& error) : std::runtime_error(error) {}
	UnavailableCellException::UnavailableCellException(const std::string& error) : std::runtime_error(error) {}
	SourceClosedException::SourceClosedException(const std::string& error) : std::runtime_error(error) {}
	InvalidRasterFileException::InvalidRasterFileException(const std::string& error) : std::runtime_error(error) {}
	BandCountMismatchException::BandCountMismatchException(const std::string& error) : std::runtime_error(error) {}
	RasterWriteException::RasterWriteException(const std::string& error) : std::runtime_error(error) {}
}
