#pragma once
#ifndef ma_mapalgebratypedefs_h
#define ma_mapalgebratypedefs_h

#include<cstdint>
#include<vector>

namespace mapalg {

	using rowcol_t = int32_t;
	using cell_t = int64_t;
	using band_t = int32_t;
	using pixel_t = double;

	//the value of one cell of a multi-band raster; element i is band i+1
	using MultiBandValue = std::vector<pixel_t>;
}

#endif
