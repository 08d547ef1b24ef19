#pragma once
#ifndef ma_pixelsink_h
#define ma_pixelsink_h

#include"mapalgebra_pch.hpp"
#include"MapAlgebraTypeDefs.hpp"
#include"MapAlgebraExceptions.hpp"
#include"GDALWrappers.hpp"

namespace mapalg {

	struct RasterWriteOptions {
		//any GDAL driver that supports Create. It's up to the caller to make sure the driver and the file extension correspond
		std::string driver = "GTiff";

		//GDT_Unknown means the type that corresponds to the raster's cell type, or GDT_Float64 if there isn't one
		GDALDataType dataType = GDT_Unknown;

		//if set, written as the nodata value of every band
		xtl::xoptional<pixel_t> noDataValue = xtl::missing<pixel_t>();

		//GDAL creation options in KEY=VALUE form, e.g. "COMPRESS=DEFLATE"
		std::vector<std::string> creationOptions;
	};

	//Somewhere a raster can be written to, one row of one band at a time. Bands are 1-based.
	//writeRow throws std::out_of_range for a band or row that doesn't exist, and std::invalid_argument if values isn't exactly one row long
	class PixelSink {
	public:
		virtual ~PixelSink() = default;

		virtual rowcol_t width() const = 0;
		virtual rowcol_t height() const = 0;
		virtual band_t nBands() const = 0;

		//the value that missing cells are written as, if any
		virtual xtl::xoptional<pixel_t> noDataValue() const = 0;

		virtual void writeRow(band_t band, rowcol_t row, const std::vector<pixel_t>& values) = 0;
		virtual void flush() = 0;

	protected:
		void checkRow(band_t band, rowcol_t row, const std::vector<pixel_t>& values) const;
	};

	//A new raster file created through GDAL. The file is closed when the sink is destroyed
	class GdalPixelSink : public PixelSink {
	public:
		//options.dataType is ignored in favor of pixelType
		GdalPixelSink(const std::string& filename, rowcol_t width, rowcol_t height, band_t nBands, GDALDataType pixelType,
			const RasterWriteOptions& options = RasterWriteOptions());

		rowcol_t width() const override;
		rowcol_t height() const override;
		band_t nBands() const override;
		xtl::xoptional<pixel_t> noDataValue() const override;

		void writeRow(band_t band, rowcol_t row, const std::vector<pixel_t>& values) override;
		void flush() override;

	private:
		std::string _filename;
		UniqueGdalDataset _dataset;
		rowcol_t _ncol, _nrow;
		band_t _nBands;
		xtl::xoptional<pixel_t> _noData = xtl::missing<pixel_t>();
	};

	//Keeps everything written to it in memory, row-major per band. Cells that were never written are 0
	class MemoryPixelSink : public PixelSink {
	public:
		MemoryPixelSink(rowcol_t width, rowcol_t height, band_t nBands, xtl::xoptional<pixel_t> noDataValue = xtl::missing<pixel_t>());

		rowcol_t width() const override;
		rowcol_t height() const override;
		band_t nBands() const override;
		xtl::xoptional<pixel_t> noDataValue() const override;

		void writeRow(band_t band, rowcol_t row, const std::vector<pixel_t>& values) override;
		void flush() override;

		pixel_t at(band_t band, rowcol_t x, rowcol_t y) const;
		int rowsWritten() const;
		int flushCount() const;

	private:
		rowcol_t _ncol, _nrow;
		std::vector<std::vector<pixel_t>> _bands;
		xtl::xoptional<pixel_t> _noData;
		int _rowsWritten = 0;
		int _flushCount = 0;
	};
}

#endif
