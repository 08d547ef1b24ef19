#pragma once
#ifndef ma_writeraster_h
#define ma_writeraster_h

#include"LazyRaster.hpp"
#include"CellTraits.hpp"
#include"PixelSink.hpp"

namespace mapalg {

	namespace detail {
		template<class T>
		using CellRow = std::vector<xtl::xoptional<T>>;

		//cells the source can't provide are missing; any other fault propagates
		template<class T>
		inline CellRow<T> evaluateRow(const LazyRaster<T>& r, rowcol_t row) {
			CellRow<T> cells;
			cells.reserve(r.width());
			for (rowcol_t col = 0; col < r.width(); ++col) {
				try {
					cells.push_back(xtl::xoptional<T>(r.atXYUnsafe(col, row)));
				}
				catch (const UnavailableCellException&) {
					cells.push_back(xtl::missing<T>());
				}
			}
			return cells;
		}

		//splits one row of cell values into per-band rows, and hands them to the sink.
		//Missing cells and NaN components are written as the sink's nodata value, or NaN if it has none
		template<class T>
		inline void writeCellRow(const CellRow<T>& cells, rowcol_t row, PixelSink& sink, std::vector<std::vector<pixel_t>>& bandRows) {
			xtl::xoptional<pixel_t> noData = sink.noDataValue();
			pixel_t missingValue = noData.has_value() ? noData.value() : std::numeric_limits<pixel_t>::quiet_NaN();

			for (size_t col = 0; col < cells.size(); ++col) {
				if (!cells[col].has_value()) {
					for (band_t band = 1; band <= sink.nBands(); ++band) {
						bandRows[band - 1][col] = missingValue;
					}
					continue;
				}
				const T& cell = cells[col].value();
				band_t cellBands = CellTraits<T>::nBands(cell);
				if (cellBands != sink.nBands()) {
					throw BandCountMismatchException("Cell (" + std::to_string(col) + ", " + std::to_string(row) + ") has "
						+ std::to_string(cellBands) + " band(s) but the output has " + std::to_string(sink.nBands()));
				}
				for (band_t band = 1; band <= cellBands; ++band) {
					pixel_t v = CellTraits<T>::component(cell, band);
					bandRows[band - 1][col] = std::isnan(v) ? missingValue : v;
				}
			}
			for (band_t band = 1; band <= sink.nBands(); ++band) {
				sink.writeRow(band, row, bandRows[band - 1]);
			}
		}

		//evaluated holds the first rows, already evaluated; the rest are evaluated here
		template<class T>
		inline void writeRows(const LazyRaster<T>& r, PixelSink& sink, const std::vector<CellRow<T>>& evaluated) {
			std::vector<std::vector<pixel_t>> bandRows(sink.nBands(), std::vector<pixel_t>(r.width()));
			rowcol_t row = 0;
			for (; row < (rowcol_t)evaluated.size(); ++row) {
				writeCellRow(evaluated[row], row, sink, bandRows);
			}
			for (; row < r.height(); ++row) {
				writeCellRow(evaluateRow(r, row), row, sink, bandRows);
			}
			sink.flush();
		}
	}

	//Materializes r into sink. Every cell is evaluated exactly once, row by row from the top;
	//multi-band values are split into their bands, and every cell must have as many bands as the sink does.
	//Cells that throw UnavailableCellException are written as missing
	template<class T>
	inline void writeRaster(const LazyRaster<T>& r, PixelSink& sink) {
		if (sink.width() != r.width() || sink.height() != r.height()) {
			throw DimensionMismatchException("Dimension mismatch in writeRaster");
		}
		detail::writeRows(r, sink, std::vector<detail::CellRow<T>>());
	}

	//Writes r to a new file. The number of bands isn't part of the raster's type, so it's taken from the first cell that has a value
	template<class T>
	inline void writeRaster(const LazyRaster<T>& r, const std::string& filename, const RasterWriteOptions& options = RasterWriteOptions()) {
		std::vector<detail::CellRow<T>> evaluated;
		band_t nBands = -1;
		for (rowcol_t row = 0; row < r.height() && nBands < 0; ++row) {
			evaluated.push_back(detail::evaluateRow(r, row));
			for (const xtl::xoptional<T>& cell : evaluated.back()) {
				if (cell.has_value()) {
					nBands = CellTraits<T>::nBands(cell.value());
					break;
				}
			}
		}
		if (nBands < 0) {
			//every cell is missing
			nBands = CellTraits<T>::nBands(T{});
		}
		if (nBands <= 0) {
			throw BandCountMismatchException("Cannot write a raster whose cells have no bands");
		}

		GDALDataType gdt = options.dataType;
		if (gdt == GDT_Unknown) {
			gdt = CellTraits<T>::GDT();
		}
		if (gdt == GDT_Unknown) {
			gdt = GDT_Float64;
		}

		GdalPixelSink sink{ filename, r.width(), r.height(), nBands, gdt, options };
		detail::writeRows(r, sink, evaluated);
		spdlog::info("Wrote {}x{} raster with {} band(s) to {}", r.width(), r.height(), nBands, filename);
	}
}

#endif
