#pragma once
#ifndef ma_rastersource_h
#define ma_rastersource_h

#include"LazyRaster.hpp"
#include"PixelSource.hpp"

namespace mapalg {

	//Owns a pixel source for a fixed scope, and makes leaf rasters that read from it.
	//The source is closed when the RasterSource is destroyed or close() is called, even if rasters built from it are still around:
	//those rasters don't keep the source alive, and reading them afterwards throws SourceClosedException
	class RasterSource {
	public:
		//opens a GDAL-readable file
		explicit RasterSource(const std::string& filename);
		explicit RasterSource(std::shared_ptr<PixelSource> source);
		~RasterSource();

		RasterSource(const RasterSource&) = delete;
		RasterSource& operator=(const RasterSource&) = delete;
		RasterSource(RasterSource&& other) noexcept;
		RasterSource& operator=(RasterSource&& other) noexcept;

		rowcol_t width() const;
		rowcol_t height() const;
		band_t nBands() const;

		//A raster whose values are read directly from one band. band is 1-based.
		//Cells equal to the band's nodata value (as of when the raster is made) throw UnavailableCellException
		LazyRaster<pixel_t> band(band_t band) const;

		//A raster whose value at each cell is the values of every band, in band order.
		//Nodata bands are NaN; a cell where every band is nodata throws UnavailableCellException
		LazyRaster<MultiBandValue> allBands() const;

		bool isOpen() const;
		void close();

	private:
		std::shared_ptr<PixelSource> _source;

		void _checkOpen() const;
	};
}

#endif
