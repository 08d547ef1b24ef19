#pragma once
#ifndef ma_gdalwrappers_h
#define ma_gdalwrappers_h

#include"mapalgebra_pch.hpp"

namespace mapalg {

	//While one of these is alive, GDAL errors raised on this thread go to spdlog.
	//It pushes onto GDAL's per-thread handler stack, so whatever handler the host application installed is left alone
	class CplErrorsToSpdlog {
	public:
		CplErrorsToSpdlog();
		~CplErrorsToSpdlog();

		CplErrorsToSpdlog(const CplErrorsToSpdlog&) = delete;
		CplErrorsToSpdlog& operator=(const CplErrorsToSpdlog&) = delete;
	};

	struct GDALDatasetDeleter {
		void operator()(GDALDataset* p) const {
			if (p) {
				CplErrorsToSpdlog errors;
				GDALClose(p);
			}
		}
	};
	using UniqueGdalDataset = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;
	UniqueGdalDataset makeUniqueGdalDataset(GDALDataset* p);

	//GDALAllRegister, done exactly once no matter how many threads ask
	void gdalAllRegisterThreadSafe();

	//returns a null pointer if the file can't be opened as a raster
	UniqueGdalDataset rasterGDALWrapper(const std::string& filename);

	//returns a null pointer if the driver doesn't exist or can't create the file
	//options are GDAL creation options in KEY=VALUE form
	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, int nBands,
		GDALDataType gdt, const std::vector<std::string>& options = {});
}

#endif
