#include"PixelSource.hpp"

namespace mapalg {

	void PixelSource::checkBand(band_t band) const {
		if (band < 1 || band > nBands()) {
			throw OutsideExtentException("Band " + std::to_string(band) + " out of range");
		}
	}
	void PixelSource::checkPixel(band_t band, rowcol_t x, rowcol_t y) const {
		checkBand(band);
		if (x < 0 || y < 0 || x >= width() || y >= height()) {
			throw OutsideExtentException("Cell (" + std::to_string(x) + ", " + std::to_string(y) + ") out of range");
		}
	}

	GdalPixelSource::GdalPixelSource(const std::string& filename) : _filename(filename) {
		_dataset = rasterGDALWrapper(filename);
		if (!_dataset) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		_ncol = _dataset->GetRasterXSize();
		_nrow = _dataset->GetRasterYSize();
		_nBands = _dataset->GetRasterCount();
		spdlog::debug("Opened {}: {}x{}, {} band(s)", filename, _ncol, _nrow, _nBands);
	}
	rowcol_t GdalPixelSource::width() const {
		return _ncol;
	}
	rowcol_t GdalPixelSource::height() const {
		return _nrow;
	}
	band_t GdalPixelSource::nBands() const {
		return _nBands;
	}
	pixel_t GdalPixelSource::readPixel(band_t band, rowcol_t x, rowcol_t y) const {
		std::scoped_lock<std::mutex> lock{ _mut };
		if (!_dataset) {
			throw SourceClosedException("Read from " + _filename + " after it was closed");
		}
		checkPixel(band, x, y);

		pixel_t out = 0;
		CplErrorsToSpdlog errors;
		GDALRasterBand* rBand = _dataset->GetRasterBand(band);
		CPLErr err = rBand->RasterIO(GF_Read, x, y, 1, 1, &out, 1, 1, GDT_Float64, 0, 0);
		if (err != CE_None) {
			throw UnavailableCellException("Unable to read cell (" + std::to_string(x) + ", " + std::to_string(y)
				+ ") of band " + std::to_string(band) + " of " + _filename);
		}
		return out;
	}
	xtl::xoptional<pixel_t> GdalPixelSource::noDataValue(band_t band) const {
		std::scoped_lock<std::mutex> lock{ _mut };
		if (!_dataset) {
			throw SourceClosedException("Read from " + _filename + " after it was closed");
		}
		checkBand(band);
		int hasNoData = 0;
		double naValue = _dataset->GetRasterBand(band)->GetNoDataValue(&hasNoData);
		if (!hasNoData) {
			return xtl::missing<pixel_t>();
		}
		return xtl::xoptional<pixel_t>(naValue);
	}
	bool GdalPixelSource::isOpen() const {
		std::scoped_lock<std::mutex> lock{ _mut };
		return (bool)_dataset;
	}
	void GdalPixelSource::close() {
		std::scoped_lock<std::mutex> lock{ _mut };
		if (_dataset) {
			_dataset.reset();
			spdlog::debug("Closed {}", _filename);
		}
	}
	const std::string& GdalPixelSource::filename() const {
		return _filename;
	}

	MemoryPixelSource::MemoryPixelSource(rowcol_t width, rowcol_t height, band_t nBands, pixel_t fill)
		: MemoryPixelSource(width, height, std::vector<std::vector<pixel_t>>(nBands < 0 ? 0 : nBands,
			std::vector<pixel_t>(width > 0 && height > 0 ? (size_t)width * height : 0, fill))) {}

	MemoryPixelSource::MemoryPixelSource(rowcol_t width, rowcol_t height, std::vector<std::vector<pixel_t>> bands)
		: _ncol(width), _nrow(height), _bands(std::move(bands)) {
		if (width <= 0 || height <= 0 || _bands.empty()) {
			throw InvalidExtentException("A pixel source needs positive dimensions and at least one band");
		}
		for (const std::vector<pixel_t>& b : _bands) {
			if (b.size() != (size_t)width * height) {
				throw InvalidExtentException("Band data doesn't match the dimensions of the pixel source");
			}
		}
		_unavailable.resize(_bands.size(), std::vector<bool>((size_t)width * height, false));
		_noData.resize(_bands.size(), xtl::missing<pixel_t>());
	}
	rowcol_t MemoryPixelSource::width() const {
		return _ncol;
	}
	rowcol_t MemoryPixelSource::height() const {
		return _nrow;
	}
	band_t MemoryPixelSource::nBands() const {
		return (band_t)_bands.size();
	}
	pixel_t MemoryPixelSource::readPixel(band_t band, rowcol_t x, rowcol_t y) const {
		if (!_open) {
			throw SourceClosedException("Read from a memory pixel source after it was closed");
		}
		checkPixel(band, x, y);
		if (_unavailable[band - 1][_cell(x, y)]) {
			throw UnavailableCellException("Cell (" + std::to_string(x) + ", " + std::to_string(y) + ") is unavailable");
		}
		return _bands[band - 1][_cell(x, y)];
	}
	xtl::xoptional<pixel_t> MemoryPixelSource::noDataValue(band_t band) const {
		checkBand(band);
		return _noData[band - 1];
	}
	bool MemoryPixelSource::isOpen() const {
		return _open;
	}
	void MemoryPixelSource::close() {
		_open = false;
	}
	void MemoryPixelSource::setPixel(band_t band, rowcol_t x, rowcol_t y, pixel_t value) {
		checkPixel(band, x, y);
		_bands[band - 1][_cell(x, y)] = value;
	}
	void MemoryPixelSource::setNoDataValue(band_t band, pixel_t value) {
		checkBand(band);
		_noData[band - 1] = xtl::xoptional<pixel_t>(value);
	}
	void MemoryPixelSource::setUnavailable(band_t band, rowcol_t x, rowcol_t y) {
		checkPixel(band, x, y);
		_unavailable[band - 1][_cell(x, y)] = true;
	}
	cell_t MemoryPixelSource::_cell(rowcol_t x, rowcol_t y) const {
		return (cell_t)y * _ncol + x;
	}
}
