#pragma once
#ifndef ma_rasteralgos_h
#define ma_rasteralgos_h

#include"Focal.hpp"

namespace mapalg {

	//The slope along each axis, in radians, as a four-band raster. The bands are, in order: up, down, left, right.
	//Each band is atan((neighbor - center) / spacing). Neighbours off the edge of the raster are NaN, so edge cells have NaN in the bands that point outward.
	//spacing is in the same linear units as the elevation; the default is the nominal 30m of the common DEM products, and is not derived from the raster
	template<class T>
	inline LazyRaster<MultiBandValue> anisotropicSlope(const LazyRaster<T>& elev, const pixel_t spacing = 30.) {
		LazyRaster<pixel_t> asPixel = mapCell(elev, [](const T& v) { return (pixel_t)v; });

		LazyRaster<MultiBandValue> rise = focalSample(asPixel, std::numeric_limits<pixel_t>::quiet_NaN(),
			[spacing](const FocalSampler<pixel_t>& s) {
				pixel_t center = s(0, 0);
				return MultiBandValue{
					(s(-1, 0) - center) / spacing,
					(s(1, 0) - center) / spacing,
					(s(0, 1) - center) / spacing,
					(s(0, -1) - center) / spacing
				};
			});

		return mapCell(rise, [](const MultiBandValue& v) {
			MultiBandValue out(v.size());
			std::transform(v.begin(), v.end(), out.begin(), [](pixel_t d) { return std::atan(d); });
			return out;
			});
	}

	struct RowColOffset {
		rowcol_t rowOffset, colOffset;
	};

	//the offsets of every cell in a square window centered on the focal cell, in row-major order
	inline std::vector<RowColOffset> squareWindowOffsets(int windowSize) {
		if (windowSize < 0 || windowSize % 2 != 1) {
			throw std::invalid_argument("Invalid window size in focal");
		}
		rowcol_t lookDist = (windowSize - 1) / 2;
		std::vector<RowColOffset> out;
		out.reserve((size_t)windowSize * windowSize);
		for (rowcol_t row = -lookDist; row <= lookDist; ++row) {
			for (rowcol_t col = -lookDist; col <= lookDist; ++col) {
				out.push_back(RowColOffset{ row,col });
			}
		}
		return out;
	}

	//The available values in the window around each cell are gathered and passed to view.
	//Cells off the edge of the raster are left out rather than defaulted, so views near the edge see fewer values.
	//Cells where view reports missing are NaN
	template<class T, class VIEW>
	inline LazyRaster<pixel_t> focalWindow(const LazyRaster<T>& r, int windowSize, VIEW view) {
		std::vector<RowColOffset> window = squareWindowOffsets(windowSize);
		return focalSample(r, T{}, [window, view](const FocalSampler<T>& s)->pixel_t {
			std::vector<pixel_t> values;
			values.reserve(window.size());
			for (const RowColOffset& offset : window) {
				xtl::xoptional<T> v = s.tryAt(offset.rowOffset, offset.colOffset);
				if (v.has_value()) {
					values.push_back((pixel_t)v.value());
				}
			}
			xtl::xoptional<pixel_t> out = view(values);
			if (!out.has_value()) {
				return std::numeric_limits<pixel_t>::quiet_NaN();
			}
			return out.value();
			});
	}

	//each of these is missing when given no values
	inline xtl::xoptional<pixel_t> viewSum(const std::vector<pixel_t>& values) {
		pixel_t sum = 0;
		for (pixel_t v : values) {
			sum += v;
		}
		return xtl::xoptional<pixel_t>(sum, !values.empty());
	}
	inline xtl::xoptional<pixel_t> viewMean(const std::vector<pixel_t>& values) {
		if (values.empty()) {
			return xtl::missing<pixel_t>();
		}
		return xtl::xoptional<pixel_t>(viewSum(values).value() / (pixel_t)values.size());
	}
	inline xtl::xoptional<pixel_t> viewMax(const std::vector<pixel_t>& values) {
		bool hasvalue = false;
		pixel_t value = std::numeric_limits<pixel_t>::lowest();
		for (pixel_t v : values) {
			hasvalue = true;
			value = std::max(value, v);
		}
		return xtl::xoptional<pixel_t>(value, hasvalue);
	}

	template<class T>
	inline LazyRaster<pixel_t> focalSum(const LazyRaster<T>& r, int windowSize) {
		return focalWindow(r, windowSize, &viewSum);
	}
	template<class T>
	inline LazyRaster<pixel_t> focalMean(const LazyRaster<T>& r, int windowSize) {
		return focalWindow(r, windowSize, &viewMean);
	}
	template<class T>
	inline LazyRaster<pixel_t> focalMax(const LazyRaster<T>& r, int windowSize) {
		return focalWindow(r, windowSize, &viewMax);
	}

	//A single band of a multi-band raster. band is 1-based. Asking for a band the cell values don't have throws std::out_of_range when the cell is evaluated
	inline LazyRaster<pixel_t> selectBand(const LazyRaster<MultiBandValue>& r, const band_t band) {
		return mapCell(r, [band](const MultiBandValue& v) {
			if (band < 1 || band > (band_t)v.size()) {
				throw std::out_of_range("Band out of range");
			}
			return v[band - 1];
			});
	}

	//Combines single-band rasters into one multi-band raster; the first raster in the list is band 1
	inline LazyRaster<MultiBandValue> stackBands(const std::vector<LazyRaster<pixel_t>>& bands) {
		if (bands.empty()) {
			throw std::invalid_argument("No bands given to stackBands");
		}
		for (const LazyRaster<pixel_t>& b : bands) {
			if (!b.isSameExtent(bands.front())) {
				throw DimensionMismatchException("Dimension mismatch in stackBands");
			}
		}
		return LazyRaster<MultiBandValue>(bands.front().width(), bands.front().height(),
			[bands](rowcol_t x, rowcol_t y) {
				MultiBandValue out;
				out.reserve(bands.size());
				for (const LazyRaster<pixel_t>& b : bands) {
					out.push_back(b.atXYUnsafe(x, y));
				}
				return out;
			});
	}
}

#endif
