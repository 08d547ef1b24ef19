#pragma once
#ifndef ma_test_pch_h
#define ma_test_pch_h

#include<gtest/gtest.h>

#include"../mapalgebra_pch.hpp"
#include"../LazyRaster.hpp"
#include"../Focal.hpp"
#include"../RasterAlgos.hpp"
#include"../RasterSource.hpp"
#include"../WriteRaster.hpp"

namespace mapalg {

	//a raster backed by a row-major table of values; rows[y][x]
	template<class T>
	inline LazyRaster<T> rasterFromRows(const std::vector<std::vector<T>>& rows) {
		return LazyRaster<T>((rowcol_t)rows.front().size(), (rowcol_t)rows.size(),
			[rows](rowcol_t x, rowcol_t y) { return rows[y][x]; });
	}

	//the same, but every evaluation is counted in calls
	template<class T>
	inline LazyRaster<T> countedRasterFromRows(const std::vector<std::vector<T>>& rows, std::shared_ptr<int> calls) {
		return LazyRaster<T>((rowcol_t)rows.front().size(), (rowcol_t)rows.size(),
			[rows, calls](rowcol_t x, rowcol_t y) {
				++(*calls);
				return rows[y][x];
			});
	}
}

#endif
