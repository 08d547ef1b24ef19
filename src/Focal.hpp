#pragma once
#ifndef ma_focal_h
#define ma_focal_h

#include"LazyRaster.hpp"

namespace mapalg {

	//Read access to the neighbourhood of a single cell, handed to the aggregation function of focalSample.
	//Offsets are relative to the cell being computed: a sample at (rowOffset, colOffset) reads the raster at
	//(x - colOffset, y + rowOffset), so positive rowOffset looks down and positive colOffset looks left.
	//
	//A sample whose cell is off the edge of the raster, or that the underlying source can't provide,
	//gives the default value. Only OutsideExtentException and UnavailableCellException are treated that way;
	//anything else thrown while reading propagates.
	//
	//The sampler refers to the raster it was built from, so it's only valid for the duration of the aggregation call.
	template<class T>
	class FocalSampler {
	public:
		FocalSampler(const LazyRaster<T>& r, const T& defaultValue, rowcol_t x, rowcol_t y)
			: _r(r), _default(defaultValue), _x(x), _y(y) {}

		T operator()(const rowcol_t rowOffset, const rowcol_t colOffset) const {
			xtl::xoptional<T> v = tryAt(rowOffset, colOffset);
			if (v.has_value()) {
				return v.value();
			}
			return _default;
		}

		//Like operator(), but an unavailable sample is reported as missing instead of being replaced by the default
		xtl::xoptional<T> tryAt(const rowcol_t rowOffset, const rowcol_t colOffset) const {
			//widened so that extreme offsets land outside the raster instead of overflowing
			cell_t x = (cell_t)_x - (cell_t)colOffset;
			cell_t y = (cell_t)_y + (cell_t)rowOffset;
			if (x < 0 || y < 0 || x >= _r.width() || y >= _r.height()) {
				return xtl::missing<T>();
			}
			try {
				return xtl::xoptional<T>(_r.atXY((rowcol_t)x, (rowcol_t)y));
			}
			catch (const OutsideExtentException&) {
				return xtl::missing<T>();
			}
			catch (const UnavailableCellException&) {
				return xtl::missing<T>();
			}
		}

		rowcol_t x() const {
			return _x;
		}
		rowcol_t y() const {
			return _y;
		}
		const T& defaultValue() const {
			return _default;
		}

	private:
		const LazyRaster<T>& _r;
		T _default;
		rowcol_t _x, _y;
	};

	//Produces a raster with the same dimensions as r, whose value at (x,y) is agg applied to a sampler centered on (x,y).
	//The output type is whatever agg returns, so a focal operation can turn a single-band raster into a multi-band one
	template<class T, class AGG>
	inline auto focalSample(const LazyRaster<T>& r, const std::type_identity_t<T>& defaultValue, AGG agg)
		->LazyRaster<std::decay_t<std::invoke_result_t<const AGG&, const FocalSampler<T>&>>> {
		using outtype = std::decay_t<std::invoke_result_t<const AGG&, const FocalSampler<T>&>>;
		return LazyRaster<outtype>(r.width(), r.height(),
			[r, defaultValue, agg](rowcol_t x, rowcol_t y)->outtype {
				const FocalSampler<T> sampler{ r, defaultValue, x, y };
				return agg(sampler);
			});
	}
}

#endif
