#pragma once
#ifndef ma_lazyraster_h
#define ma_lazyraster_h

#include"mapalgebra_pch.hpp"
#include"MapAlgebraTypeDefs.hpp"
#include"MapAlgebraExceptions.hpp"

#include<ostream>
#include<typeinfo>

namespace mapalg {

	//A raster whose cell values are computed on demand.
	//The value at (x,y) is whatever the evaluator returns for (x,y); nothing is read or computed until a cell is asked for,
	//and nothing is remembered afterwards, so asking for the same cell twice runs the whole chain twice.
	//x is the column (0 at the left) and y is the row (0 at the top).
	//Copies share the same evaluator, and derived rasters hold copies of their operands, so a raster can feed any number of others.
	template<class T>
	class LazyRaster {
	public:
		using value_type = T;
		using Evaluator = std::function<T(rowcol_t, rowcol_t)>;

		//the evaluator must be pure: the same (x,y) always gives the same value, and nothing else changes
		LazyRaster(rowcol_t width, rowcol_t height, Evaluator evaluator) : _width(width), _height(height) {
			if (width <= 0 || height <= 0) {
				throw InvalidExtentException("Raster dimensions must be positive, got "
					+ std::to_string(width) + "x" + std::to_string(height));
			}
			if (!evaluator) {
				throw InvalidExtentException("Raster constructed without an evaluator");
			}
			_eval = std::make_shared<const Evaluator>(std::move(evaluator));
		}

		rowcol_t width() const {
			return _width;
		}
		rowcol_t height() const {
			return _height;
		}
		cell_t ncell() const {
			return (cell_t)_width * (cell_t)_height;
		}

		bool contains(const rowcol_t x, const rowcol_t y) const {
			return x >= 0 && y >= 0 && x < _width && y < _height;
		}

		template<class S>
		bool isSameExtent(const LazyRaster<S>& other) const {
			return _width == other.width() && _height == other.height();
		}

		//Evaluates a single cell. atXY throws OutsideExtentException if (x,y) isn't in the raster; the others don't check
		T atXY(const rowcol_t x, const rowcol_t y) const {
			_checkXY(x, y);
			return atXYUnsafe(x, y);
		}
		T atXYUnsafe(const rowcol_t x, const rowcol_t y) const {
			return (*_eval)(x, y);
		}
		T operator()(const rowcol_t x, const rowcol_t y) const {
			return atXYUnsafe(x, y);
		}

		const std::shared_ptr<const Evaluator>& evaluator() const {
			return _eval;
		}

	private:
		rowcol_t _width;
		rowcol_t _height;
		std::shared_ptr<const Evaluator> _eval;

		void _checkXY(const rowcol_t x, const rowcol_t y) const {
			if (!contains(x, y)) {
				throw OutsideExtentException("Cell (" + std::to_string(x) + ", " + std::to_string(y)
					+ ") is outside of a " + std::to_string(_width) + "x" + std::to_string(_height) + " raster");
			}
		}
	};

	template<class T>
	inline std::ostream& operator<<(std::ostream& os, const LazyRaster<T>& r) {
		os << "LAZY RASTER: " << typeid(T).name() << " " << r.width() << "x" << r.height();
		return os;
	}

	//Lifts f into a cell-wise transform: the output's value at (x,y) is f(r(x,y))
	template<class T, class F>
	inline auto mapCell(const LazyRaster<T>& r, F f)->LazyRaster<std::decay_t<std::invoke_result_t<const F&, const T&>>> {
		using outtype = std::decay_t<std::invoke_result_t<const F&, const T&>>;
		return LazyRaster<outtype>(r.width(), r.height(),
			[r, f](rowcol_t x, rowcol_t y)->outtype {
				return f(r.atXYUnsafe(x, y));
			});
	}

	//Lifts f into an elementwise transform of two rasters: the output's value at (x,y) is f(a(x,y), b(x,y))
	//a and b must have the same dimensions
	template<class F, class T, class S>
	inline auto zipCells(F f, const LazyRaster<T>& a, const LazyRaster<S>& b)
		->LazyRaster<std::decay_t<std::invoke_result_t<const F&, const T&, const S&>>> {
		if (!a.isSameExtent(b)) {
			throw DimensionMismatchException("Dimension mismatch in zipCells: "
				+ std::to_string(a.width()) + "x" + std::to_string(a.height()) + " vs "
				+ std::to_string(b.width()) + "x" + std::to_string(b.height()));
		}
		using outtype = std::decay_t<std::invoke_result_t<const F&, const T&, const S&>>;
		return LazyRaster<outtype>(a.width(), a.height(),
			[a, b, f](rowcol_t x, rowcol_t y)->outtype {
				return f(a.atXYUnsafe(x, y), b.atXYUnsafe(x, y));
			});
	}

	//The output's value at (x,y) is f(c, r(x,y)). The constant is always the first argument to f,
	//so for something like r - c, f has to put its arguments back in the right order
	template<class F, class C, class T>
	inline auto zipWithConstant(F f, const C c, const LazyRaster<T>& r)
		->LazyRaster<std::decay_t<std::invoke_result_t<const F&, const C&, const T&>>> {
		using outtype = std::decay_t<std::invoke_result_t<const F&, const C&, const T&>>;
		return LazyRaster<outtype>(r.width(), r.height(),
			[c, r, f](rowcol_t x, rowcol_t y)->outtype {
				return f(c, r.atXYUnsafe(x, y));
			});
	}

	template<class S>
	using EnableIfScalar = std::enable_if_t<std::is_arithmetic_v<S>, bool>;

	template<class T, class S>
	inline auto operator+(const LazyRaster<T>& lhs, const LazyRaster<S>& rhs) {
		return zipCells([](const T& a, const S& b) { return a + b; }, lhs, rhs);
	}
	template<class T, class S, EnableIfScalar<S> = true>
	inline auto operator+(const LazyRaster<T>& lhs, const S rhs) {
		return zipWithConstant([](const S c, const T& v) { return v + c; }, rhs, lhs);
	}
	template<class T, class S, EnableIfScalar<S> = true>
	inline auto operator+(const S lhs, const LazyRaster<T>& rhs) {
		return zipWithConstant([](const S c, const T& v) { return c + v; }, lhs, rhs);
	}

	template<class T, class S>
	inline auto operator-(const LazyRaster<T>& lhs, const LazyRaster<S>& rhs) {
		return zipCells([](const T& a, const S& b) { return a - b; }, lhs, rhs);
	}
	template<class T, class S, EnableIfScalar<S> = true>
	inline auto operator-(const LazyRaster<T>& lhs, const S rhs) {
		return zipWithConstant([](const S c, const T& v) { return v - c; }, rhs, lhs);
	}
	template<class T, class S, EnableIfScalar<S> = true>
	inline auto operator-(const S lhs, const LazyRaster<T>& rhs) {
		return zipWithConstant([](const S c, const T& v) { return c - v; }, lhs, rhs);
	}

	template<class T, class S>
	inline auto operator*(const LazyRaster<T>& lhs, const LazyRaster<S>& rhs) {
		return zipCells([](const T& a, const S& b) { return a * b; }, lhs, rhs);
	}
	template<class T, class S, EnableIfScalar<S> = true>
	inline auto operator*(const LazyRaster<T>& lhs, const S rhs) {
		return zipWithConstant([](const S c, const T& v) { return v * c; }, rhs, lhs);
	}
	template<class T, class S, EnableIfScalar<S> = true>
	inline auto operator*(const S lhs, const LazyRaster<T>& rhs) {
		return zipWithConstant([](const S c, const T& v) { return c * v; }, lhs, rhs);
	}

	//division follows the math of the cell types: integral rasters truncate, and dividing by zero is the caller's problem
	template<class T, class S>
	inline auto operator/(const LazyRaster<T>& lhs, const LazyRaster<S>& rhs) {
		return zipCells([](const T& a, const S& b) { return a / b; }, lhs, rhs);
	}
	template<class T, class S, EnableIfScalar<S> = true>
	inline auto operator/(const LazyRaster<T>& lhs, const S rhs) {
		return zipWithConstant([](const S c, const T& v) { return v / c; }, rhs, lhs);
	}
	template<class T, class S, EnableIfScalar<S> = true>
	inline auto operator/(const S lhs, const LazyRaster<T>& rhs) {
		return zipWithConstant([](const S c, const T& v) { return c / v; }, lhs, rhs);
	}

	template<class T, class S, EnableIfScalar<S> = true>
	inline auto pow(const LazyRaster<T>& base, const S exponent) {
		return zipWithConstant([](const S c, const T& v) { return std::pow(v, c); }, exponent, base);
	}
	template<class T, class S, EnableIfScalar<S> = true>
	inline auto pow(const S base, const LazyRaster<T>& exponent) {
		return zipWithConstant([](const S c, const T& v) { return std::pow(c, v); }, base, exponent);
	}

	template<class T>
	inline auto operator-(const LazyRaster<T>& r) {
		return mapCell(r, [](const T& v) { return -v; });
	}

	template<class T>
	inline auto cos(const LazyRaster<T>& r) {
		return mapCell(r, [](const T& v) { return std::cos(v); });
	}
	template<class T>
	inline auto sin(const LazyRaster<T>& r) {
		return mapCell(r, [](const T& v) { return std::sin(v); });
	}
	template<class T>
	inline auto tan(const LazyRaster<T>& r) {
		return mapCell(r, [](const T& v) { return std::tan(v); });
	}
	template<class T>
	inline auto atan(const LazyRaster<T>& r) {
		return mapCell(r, [](const T& v) { return std::atan(v); });
	}
	template<class T>
	inline auto log(const LazyRaster<T>& r) {
		return mapCell(r, [](const T& v) { return std::log(v); });
	}
	template<class T>
	inline auto exp(const LazyRaster<T>& r) {
		return mapCell(r, [](const T& v) { return std::exp(v); });
	}
	template<class T>
	inline auto sqrt(const LazyRaster<T>& r) {
		return mapCell(r, [](const T& v) { return std::sqrt(v); });
	}
	template<class T>
	inline auto abs(const LazyRaster<T>& r) {
		return mapCell(r, [](const T& v) { return std::abs(v); });
	}
}

#endif
