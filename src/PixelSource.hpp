#pragma once
#ifndef ma_pixelsource_h
#define ma_pixelsource_h

#include"mapalgebra_pch.hpp"
#include"MapAlgebraTypeDefs.hpp"
#include"MapAlgebraExceptions.hpp"
#include"GDALWrappers.hpp"

namespace mapalg {

	//Something leaf rasters can read single pixels from. Bands are 1-based.
	//readPixel throws OutsideExtentException for a band or cell that doesn't exist, UnavailableCellException if the read itself fails,
	//and SourceClosedException once close() has been called.
	class PixelSource {
	public:
		virtual ~PixelSource() = default;

		virtual rowcol_t width() const = 0;
		virtual rowcol_t height() const = 0;
		virtual band_t nBands() const = 0;

		virtual pixel_t readPixel(band_t band, rowcol_t x, rowcol_t y) const = 0;
		virtual xtl::xoptional<pixel_t> noDataValue(band_t band) const = 0;

		virtual bool isOpen() const = 0;
		virtual void close() = 0;

	protected:
		//throws the appropriate exception if the read can't happen. Doesn't check isOpen
		void checkPixel(band_t band, rowcol_t x, rowcol_t y) const;
		void checkBand(band_t band) const;
	};

	//A raster file opened read-only through GDAL. Pixels are read one at a time as doubles, whatever the file's type.
	//Reads are serialized, so a GdalPixelSource can be read from several threads
	class GdalPixelSource : public PixelSource {
	public:
		explicit GdalPixelSource(const std::string& filename);

		rowcol_t width() const override;
		rowcol_t height() const override;
		band_t nBands() const override;

		pixel_t readPixel(band_t band, rowcol_t x, rowcol_t y) const override;
		xtl::xoptional<pixel_t> noDataValue(band_t band) const override;

		bool isOpen() const override;
		void close() override;

		const std::string& filename() const;

	private:
		std::string _filename;
		UniqueGdalDataset _dataset;
		rowcol_t _ncol = 0;
		rowcol_t _nrow = 0;
		band_t _nBands = 0;
		mutable std::mutex _mut;
	};

	//Row-major pixel buffers held in memory. Not thread safe
	class MemoryPixelSource : public PixelSource {
	public:
		//every pixel starts as fill
		MemoryPixelSource(rowcol_t width, rowcol_t height, band_t nBands, pixel_t fill = 0);
		//each element of bands is one band's data in row-major order, and must have width*height elements
		MemoryPixelSource(rowcol_t width, rowcol_t height, std::vector<std::vector<pixel_t>> bands);

		rowcol_t width() const override;
		rowcol_t height() const override;
		band_t nBands() const override;

		pixel_t readPixel(band_t band, rowcol_t x, rowcol_t y) const override;
		xtl::xoptional<pixel_t> noDataValue(band_t band) const override;

		bool isOpen() const override;
		void close() override;

		void setPixel(band_t band, rowcol_t x, rowcol_t y, pixel_t value);
		void setNoDataValue(band_t band, pixel_t value);

		//marks a cell as unreadable: reading it throws UnavailableCellException
		void setUnavailable(band_t band, rowcol_t x, rowcol_t y);

	private:
		rowcol_t _ncol, _nrow;
		std::vector<std::vector<pixel_t>> _bands;
		std::vector<std::vector<bool>> _unavailable;
		std::vector<xtl::xoptional<pixel_t>> _noData;
		bool _open = true;

		cell_t _cell(rowcol_t x, rowcol_t y) const;
	};
}

#endif
