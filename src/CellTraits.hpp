#pragma once
#ifndef ma_celltraits_h
#define ma_celltraits_h

#include"mapalgebra_pch.hpp"
#include"MapAlgebraTypeDefs.hpp"

namespace mapalg {

	//How the write path sees a cell value: how many bands it has, and the value of each band.
	//Bands are 1-based, the same as GDAL's.
	template<class T>
	struct CellTraits {
		static band_t nBands(const T&) {
			return 1;
		}
		static pixel_t component(const T& v, const band_t) {
			return (pixel_t)v;
		}

		//the GDAL data type corresponding to T, or GDT_Unknown if there isn't one
		static GDALDataType GDT() {
			if (std::is_same<T, double>::value) {
				return GDT_Float64;
			}
			if (std::is_same<T, float>::value) {
				return GDT_Float32;
			}
			if (std::is_same<T, std::uint8_t>::value) {
				return GDT_Byte;
			}
			if (std::is_same<T, std::int16_t>::value) {
				return GDT_Int16;
			}
			if (std::is_same<T, std::int32_t>::value) {
				return GDT_Int32;
			}
			if (std::is_same<T, std::int64_t>::value) {
				return GDT_Int64;
			}
			if (std::is_same<T, std::uint16_t>::value) {
				return GDT_UInt16;
			}
			if (std::is_same<T, std::uint32_t>::value) {
				return GDT_UInt32;
			}
			if (std::is_same<T, std::uint64_t>::value) {
				return GDT_UInt64;
			}
			return GDT_Unknown;
		}
	};

	template<class U>
	struct CellTraits<std::vector<U>> {
		static band_t nBands(const std::vector<U>& v) {
			return (band_t)v.size();
		}
		static pixel_t component(const std::vector<U>& v, const band_t band) {
			return (pixel_t)v[band - 1];
		}
		static GDALDataType GDT() {
			return CellTraits<U>::GDT();
		}
	};
}

#endif
