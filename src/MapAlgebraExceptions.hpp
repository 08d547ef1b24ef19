#pragma once
#ifndef ma_mapalgebraexceptions_h
#define ma_mapalgebraexceptions_h

#include<stdexcept>
#include<string>

namespace mapalg {

	//thrown when two rasters that must share an extent don't
	class DimensionMismatchException : public std::runtime_error {
	public:
		DimensionMismatchException(const std::string& error);
	};

	class InvalidExtentException : public std::runtime_error {
	public:
		InvalidExtentException(const std::string& error);
	};

	//the explicit 'out of range' signal for a cell read. The focal sampler treats this as a missing neighbour
	class OutsideExtentException : public std::runtime_error {
	public:
		OutsideExtentException(const std::string& error);
	};

	//a read that was in range but couldn't be served by the pixel source. Also treated as a missing neighbour
	class UnavailableCellException : public std::runtime_error {
	public:
		UnavailableCellException(const std::string& error);
	};

	//a leaf raster was read after its source was closed. Never absorbed
	class SourceClosedException : public std::runtime_error {
	public:
		SourceClosedException(const std::string& error);
	};

	class InvalidRasterFileException : public std::runtime_error {
	public:
		InvalidRasterFileException(const std::string& error);
	};

	class BandCountMismatchException : public std::runtime_error {
	public:
		BandCountMismatchException(const std::string& error);
	};

	class RasterWriteException : public std::runtime_error {
	public:
		RasterWriteException(const std::string& error);
	};
}

#endif
