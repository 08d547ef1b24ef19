#include"PixelSink.hpp"

namespace mapalg {

	void PixelSink::checkRow(band_t band, rowcol_t row, const std::vector<pixel_t>& values) const {
		if (band < 1 || band > nBands()) {
			throw std::out_of_range("Band out of range");
		}
		if (row < 0 || row >= height()) {
			throw std::out_of_range("Row out of range");
		}
		if (values.size() != (size_t)width()) {
			throw std::invalid_argument("Row has " + std::to_string(values.size()) + " values but the raster is "
				+ std::to_string(width()) + " cells wide");
		}
	}

	GdalPixelSink::GdalPixelSink(const std::string& filename, rowcol_t width, rowcol_t height, band_t nBands, GDALDataType pixelType,
		const RasterWriteOptions& options)
		: _filename(filename), _ncol(width), _nrow(height), _nBands(nBands) {
		if (width <= 0 || height <= 0 || nBands <= 0) {
			throw InvalidExtentException("Cannot create a raster with dimensions " + std::to_string(width) + "x"
				+ std::to_string(height) + "x" + std::to_string(nBands));
		}
		_dataset = gdalCreateWrapper(options.driver, filename, width, height, nBands, pixelType, options.creationOptions);
		if (!_dataset) {
			throw InvalidRasterFileException("Unable to create " + filename + " with driver " + options.driver);
		}
		_noData = options.noDataValue;
		if (_noData.has_value()) {
			CplErrorsToSpdlog errors;
			for (band_t band = 1; band <= nBands; ++band) {
				if (_dataset->GetRasterBand(band)->SetNoDataValue(_noData.value()) != CE_None) {
					throw RasterWriteException("Unable to set the nodata value of band " + std::to_string(band) + " of " + filename);
				}
			}
		}
		spdlog::debug("Created {} ({}): {}x{}, {} band(s) of {}", filename, options.driver, width, height, nBands,
			GDALGetDataTypeName(pixelType));
	}
	rowcol_t GdalPixelSink::width() const {
		return _ncol;
	}
	rowcol_t GdalPixelSink::height() const {
		return _nrow;
	}
	band_t GdalPixelSink::nBands() const {
		return _nBands;
	}
	xtl::xoptional<pixel_t> GdalPixelSink::noDataValue() const {
		return _noData;
	}
	void GdalPixelSink::writeRow(band_t band, rowcol_t row, const std::vector<pixel_t>& values) {
		checkRow(band, row, values);
		//RasterIO takes a non-const buffer even for writing; it doesn't modify it
		pixel_t* data = const_cast<pixel_t*>(values.data());
		CplErrorsToSpdlog errors;
		CPLErr err = _dataset->GetRasterBand(band)->RasterIO(GF_Write, 0, row, _ncol, 1, data, _ncol, 1, GDT_Float64, 0, 0);
		if (err != CE_None) {
			throw RasterWriteException("Unable to write row " + std::to_string(row) + " of band " + std::to_string(band)
				+ " to " + _filename);
		}
	}
	void GdalPixelSink::flush() {
		CplErrorsToSpdlog errors;
#if GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 7, 0)
		if (_dataset->FlushCache() != CE_None) {
			throw RasterWriteException("Unable to flush " + _filename);
		}
#else
		_dataset->FlushCache();
#endif
		spdlog::debug("Flushed {}", _filename);
	}

	MemoryPixelSink::MemoryPixelSink(rowcol_t width, rowcol_t height, band_t nBands, xtl::xoptional<pixel_t> noDataValue)
		: _ncol(width), _nrow(height), _noData(noDataValue) {
		if (width <= 0 || height <= 0 || nBands <= 0) {
			throw InvalidExtentException("Cannot create a raster with dimensions " + std::to_string(width) + "x"
				+ std::to_string(height) + "x" + std::to_string(nBands));
		}
		_bands.resize(nBands, std::vector<pixel_t>((size_t)width * height, 0));
	}
	rowcol_t MemoryPixelSink::width() const {
		return _ncol;
	}
	rowcol_t MemoryPixelSink::height() const {
		return _nrow;
	}
	band_t MemoryPixelSink::nBands() const {
		return (band_t)_bands.size();
	}
	xtl::xoptional<pixel_t> MemoryPixelSink::noDataValue() const {
		return _noData;
	}
	void MemoryPixelSink::writeRow(band_t band, rowcol_t row, const std::vector<pixel_t>& values) {
		checkRow(band, row, values);
		std::copy(values.begin(), values.end(), _bands[band - 1].begin() + (size_t)row * _ncol);
		++_rowsWritten;
	}
	void MemoryPixelSink::flush() {
		++_flushCount;
	}
	pixel_t MemoryPixelSink::at(band_t band, rowcol_t x, rowcol_t y) const {
		if (band < 1 || band > nBands() || x < 0 || y < 0 || x >= _ncol || y >= _nrow) {
			throw std::out_of_range("Cell out of range");
		}
		return _bands[band - 1][(size_t)y * _ncol + x];
	}
	int MemoryPixelSink::rowsWritten() const {
		return _rowsWritten;
	}
	int MemoryPixelSink::flushCount() const {
		return _flushCount;
	}
}
