#include"GDALWrappers.hpp"

namespace mapalg {

	namespace {
		void CPL_STDCALL spdlogErrorHandler(CPLErr errClass, CPLErrorNum errNum, const char* msg) {
			switch (errClass) {
			case CE_None:
				return;
			case CE_Debug:
				spdlog::debug("GDAL: {}", msg);
				return;
			case CE_Warning:
				spdlog::warn("GDAL ({}): {}", errNum, msg);
				return;
			default:
				spdlog::error("GDAL ({}): {}", errNum, msg);
				return;
			}
		}
	}

	CplErrorsToSpdlog::CplErrorsToSpdlog() {
		CPLPushErrorHandler(&spdlogErrorHandler);
	}
	CplErrorsToSpdlog::~CplErrorsToSpdlog() {
		CPLPopErrorHandler();
	}

	UniqueGdalDataset makeUniqueGdalDataset(GDALDataset* p) {
		return UniqueGdalDataset(p);
	}

	void gdalAllRegisterThreadSafe() {
		static std::once_flag flag;
		std::call_once(flag, []() {
			CplErrorsToSpdlog errors;
			GDALAllRegister();
			});
	}

	UniqueGdalDataset rasterGDALWrapper(const std::string& filename) {
		gdalAllRegisterThreadSafe();
		CplErrorsToSpdlog errors;
		GDALDataset* raw = (GDALDataset*)GDALOpenEx(filename.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr);
		return makeUniqueGdalDataset(raw);
	}

	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, int nBands,
		GDALDataType gdt, const std::vector<std::string>& options) {
		gdalAllRegisterThreadSafe();
		CplErrorsToSpdlog errors;
		GDALDriver* d = GetGDALDriverManager()->GetDriverByName(driver.c_str());
		if (!d) {
			spdlog::error("No GDAL driver named {}", driver);
			return UniqueGdalDataset();
		}
		CPLStringList createOptions;
		for (const std::string& option : options) {
			createOptions.AddString(option.c_str());
		}
		return makeUniqueGdalDataset(d->Create(file.c_str(), ncol, nrow, nBands, gdt, createOptions.List()));
	}
}
