#include"RasterSource.hpp"

namespace mapalg {

	namespace {
		std::shared_ptr<PixelSource> lockSource(const std::weak_ptr<PixelSource>& weak) {
			std::shared_ptr<PixelSource> source = weak.lock();
			if (!source || !source->isOpen()) {
				throw SourceClosedException("Leaf raster read after its source was closed");
			}
			return source;
		}

		bool isNoData(pixel_t v, const xtl::xoptional<pixel_t>& noData) {
			if (!noData.has_value()) {
				return false;
			}
			if (std::isnan(noData.value())) {
				return std::isnan(v);
			}
			return v == noData.value();
		}

		std::string noDataMessage(rowcol_t x, rowcol_t y) {
			return "Cell (" + std::to_string(x) + ", " + std::to_string(y) + ") is nodata";
		}
	}

	RasterSource::RasterSource(const std::string& filename)
		: _source(std::make_shared<GdalPixelSource>(filename)) {}

	RasterSource::RasterSource(std::shared_ptr<PixelSource> source) : _source(std::move(source)) {
		if (!_source) {
			throw std::invalid_argument("RasterSource constructed from a null pixel source");
		}
	}

	RasterSource::~RasterSource() {
		close();
	}

	RasterSource::RasterSource(RasterSource&& other) noexcept : _source(std::move(other._source)) {}

	RasterSource& RasterSource::operator=(RasterSource&& other) noexcept {
		if (this != &other) {
			close();
			_source = std::move(other._source);
		}
		return *this;
	}

	rowcol_t RasterSource::width() const {
		_checkOpen();
		return _source->width();
	}
	rowcol_t RasterSource::height() const {
		_checkOpen();
		return _source->height();
	}
	band_t RasterSource::nBands() const {
		_checkOpen();
		return _source->nBands();
	}

	LazyRaster<pixel_t> RasterSource::band(band_t band) const {
		_checkOpen();
		if (band < 1 || band > _source->nBands()) {
			throw std::out_of_range("Band out of range");
		}
		std::weak_ptr<PixelSource> weak = _source;
		xtl::xoptional<pixel_t> noData = _source->noDataValue(band);
		return LazyRaster<pixel_t>(_source->width(), _source->height(),
			[weak, band, noData](rowcol_t x, rowcol_t y) {
				pixel_t v = lockSource(weak)->readPixel(band, x, y);
				if (isNoData(v, noData)) {
					throw UnavailableCellException(noDataMessage(x, y));
				}
				return v;
			});
	}

	LazyRaster<MultiBandValue> RasterSource::allBands() const {
		_checkOpen();
		std::weak_ptr<PixelSource> weak = _source;
		band_t nBand = _source->nBands();
		std::vector<xtl::xoptional<pixel_t>> noData;
		for (band_t band = 1; band <= nBand; ++band) {
			noData.push_back(_source->noDataValue(band));
		}
		return LazyRaster<MultiBandValue>(_source->width(), _source->height(),
			[weak, nBand, noData](rowcol_t x, rowcol_t y) {
				std::shared_ptr<PixelSource> source = lockSource(weak);
				MultiBandValue out;
				out.reserve(nBand);
				band_t noDataBands = 0;
				for (band_t band = 1; band <= nBand; ++band) {
					pixel_t v = source->readPixel(band, x, y);
					if (isNoData(v, noData[band - 1])) {
						v = std::numeric_limits<pixel_t>::quiet_NaN();
						++noDataBands;
					}
					out.push_back(v);
				}
				if (noDataBands == nBand) {
					throw UnavailableCellException(noDataMessage(x, y));
				}
				return out;
			});
	}

	bool RasterSource::isOpen() const {
		return _source && _source->isOpen();
	}

	void RasterSource::close() {
		if (_source) {
			_source->close();
			_source.reset();
		}
	}

	void RasterSource::_checkOpen() const {
		if (!isOpen()) {
			throw SourceClosedException("RasterSource used after it was closed");
		}
	}
}
