#include"test_pch.hpp"

namespace mapalg {

	class LazyRasterTest : public ::testing::Test {
	public:
		std::shared_ptr<int> calls = std::make_shared<int>(0);

		LazyRaster<double> a = rasterFromRows<double>({ {1, 2}, {3, 4} });
		LazyRaster<double> b = rasterFromRows<double>({ {5, 6}, {7, 8} });
		LazyRaster<double> counted = countedRasterFromRows<double>({ {0, 1, 2}, {3, 4, 5} }, calls);
	};

	TEST_F(LazyRasterTest, Dimensions) {
		EXPECT_EQ(counted.width(), 3);
		EXPECT_EQ(counted.height(), 2);
		EXPECT_EQ(counted.ncell(), 6);
		EXPECT_TRUE(counted.contains(2, 1));
		EXPECT_FALSE(counted.contains(3, 1));
		EXPECT_FALSE(counted.contains(2, 2));
		EXPECT_FALSE(counted.contains(-1, 0));
		EXPECT_TRUE(a.isSameExtent(b));
		EXPECT_FALSE(a.isSameExtent(counted));
	}

	TEST_F(LazyRasterTest, InvalidConstruction) {
		auto f = [](rowcol_t, rowcol_t) { return 0.; };
		EXPECT_THROW(LazyRaster<double>(0, 3, f), InvalidExtentException);
		EXPECT_THROW(LazyRaster<double>(3, 0, f), InvalidExtentException);
		EXPECT_THROW(LazyRaster<double>(-2, 3, f), InvalidExtentException);
		EXPECT_THROW(LazyRaster<double>(3, 3, LazyRaster<double>::Evaluator()), InvalidExtentException);
		EXPECT_NO_THROW(LazyRaster<double>(1, 1, f));
	}

	TEST_F(LazyRasterTest, AtXYChecksBounds) {
		EXPECT_EQ(counted.atXY(2, 1), 5);
		EXPECT_THROW(counted.atXY(3, 0), OutsideExtentException);
		EXPECT_THROW(counted.atXY(0, -1), OutsideExtentException);
		EXPECT_EQ(*calls, 1);
	}

	TEST_F(LazyRasterTest, CompositionIsLazy) {
		auto sum = counted + counted;
		auto diff = counted - 3.;
		auto scaled = 2. * counted;
		auto quotient = 1. / counted;
		auto powered = pow(counted, 2.);
		auto trig = cos(counted);
		auto mapped = mapCell(counted, [](double v) { return v * v; });
		auto zipped = zipCells([](double x, double y) { return x - y; }, counted, counted);
		auto focal = focalSample(counted, 0., [](const FocalSampler<double>& s) { return s(0, 0) + s(1, 0); });
		auto deep = cos((counted + 1.) * counted) - sin(counted);
		auto slope = anisotropicSlope(counted);
		auto windowSum = focalSum(counted, 3);
		auto windowMean = focalMean(counted, 3);
		auto windowMax = focalMax(counted, 5);
		auto stacked = stackBands({ counted, counted * 2. });
		auto selected = selectBand(stacked, 2);
		auto slopeBand = selectBand(slope, 1);
		EXPECT_EQ(*calls, 0);

		EXPECT_DOUBLE_EQ(selected(1, 0), 2);
		EXPECT_EQ(*calls, 2);
		*calls = 0;

		EXPECT_EQ(sum(1, 1), 8);
		EXPECT_EQ(*calls, 2);

		//nothing is remembered between demands
		EXPECT_EQ(sum(1, 1), 8);
		EXPECT_EQ(*calls, 4);
	}

	TEST_F(LazyRasterTest, ElementwiseArithmetic) {
		auto sum = a + b;
		auto diff = a - b;
		auto prod = a * b;
		auto quot = a / b;
		for (rowcol_t y = 0; y < a.height(); ++y) {
			for (rowcol_t x = 0; x < a.width(); ++x) {
				EXPECT_EQ(sum(x, y), a(x, y) + b(x, y));
				EXPECT_EQ(diff(x, y), a(x, y) - b(x, y));
				EXPECT_EQ(prod(x, y), a(x, y) * b(x, y));
				EXPECT_EQ(quot(x, y), a(x, y) / b(x, y));
			}
		}
		EXPECT_EQ(sum.width(), 2);
		EXPECT_EQ(sum.height(), 2);
	}

	TEST_F(LazyRasterTest, ScalarOperandOrder) {
		const double c = 10;
		auto cMinusR = c - a;
		auto rMinusC = a - c;
		auto cOverR = c / a;
		auto rOverC = a / c;
		auto cToTheR = pow(c, a);
		auto rToTheC = pow(a, 2.);
		for (rowcol_t y = 0; y < a.height(); ++y) {
			for (rowcol_t x = 0; x < a.width(); ++x) {
				EXPECT_EQ(cMinusR(x, y), c - a(x, y));
				EXPECT_EQ(rMinusC(x, y), a(x, y) - c);
				EXPECT_NE(cMinusR(x, y), rMinusC(x, y));

				EXPECT_DOUBLE_EQ(cOverR(x, y), c / a(x, y));
				EXPECT_DOUBLE_EQ(rOverC(x, y), a(x, y) / c);
				EXPECT_NE(cOverR(x, y), rOverC(x, y));

				EXPECT_DOUBLE_EQ(cToTheR(x, y), std::pow(c, a(x, y)));
				EXPECT_DOUBLE_EQ(rToTheC(x, y), std::pow(a(x, y), 2.));
			}
		}
		EXPECT_EQ((a + c)(1, 1), 14);
		EXPECT_EQ((c + a)(1, 1), 14);
		EXPECT_EQ((a * c)(1, 0), 20);
		EXPECT_EQ((c * a)(1, 0), 20);
	}

	TEST_F(LazyRasterTest, ZipWithConstantArgumentOrder) {
		auto r = zipWithConstant([](double c, double v) { return c - v; }, 1., a);
		EXPECT_EQ(r(0, 0), 0);
		EXPECT_EQ(r(1, 1), -3);
	}

	TEST_F(LazyRasterTest, DimensionMismatch) {
		auto f = [](rowcol_t, rowcol_t) { return 1.; };
		LazyRaster<double> threeByThree{ 3, 3, f };
		LazyRaster<double> fourByThree{ 4, 3, f };
		LazyRaster<double> threeByFour{ 3, 4, f };
		EXPECT_THROW(threeByThree + fourByThree, DimensionMismatchException);
		EXPECT_THROW(threeByThree - threeByFour, DimensionMismatchException);
		EXPECT_THROW(threeByThree * fourByThree, DimensionMismatchException);
		EXPECT_THROW(fourByThree / threeByThree, DimensionMismatchException);
		EXPECT_THROW(zipCells([](double x, double y) { return x + y; }, threeByThree, fourByThree), DimensionMismatchException);
		EXPECT_NO_THROW(threeByThree + threeByThree);
	}

	TEST_F(LazyRasterTest, UnaryComposition) {
		auto zero = rasterFromRows<double>({ {0, 0.5}, {1, 2} });
		EXPECT_EQ(cos(zero)(0, 0), 1);

		auto f = [](double v) { return v * 3 + 1; };
		auto g = [](double v) { return v * v; };
		auto composed = mapCell(mapCell(zero, g), f);
		for (rowcol_t y = 0; y < zero.height(); ++y) {
			for (rowcol_t x = 0; x < zero.width(); ++x) {
				EXPECT_EQ(composed(x, y), f(g(zero(x, y))));
			}
		}
	}

	TEST_F(LazyRasterTest, Transcendentals) {
		auto r = rasterFromRows<double>({ {0.25, 0.5}, {1, 2} });
		for (rowcol_t y = 0; y < r.height(); ++y) {
			for (rowcol_t x = 0; x < r.width(); ++x) {
				double v = r(x, y);
				EXPECT_DOUBLE_EQ(cos(r)(x, y), std::cos(v));
				EXPECT_DOUBLE_EQ(sin(r)(x, y), std::sin(v));
				EXPECT_DOUBLE_EQ(tan(r)(x, y), std::tan(v));
				EXPECT_DOUBLE_EQ(atan(r)(x, y), std::atan(v));
				EXPECT_DOUBLE_EQ(log(r)(x, y), std::log(v));
				EXPECT_DOUBLE_EQ(exp(r)(x, y), std::exp(v));
				EXPECT_DOUBLE_EQ(sqrt(r)(x, y), std::sqrt(v));
				EXPECT_DOUBLE_EQ(abs(-r)(x, y), v);
				EXPECT_DOUBLE_EQ((-r)(x, y), -v);
			}
		}
	}

	TEST_F(LazyRasterTest, ValueTypes) {
		LazyRaster<int> ints = rasterFromRows<int>({ {1, 2}, {3, 4} });
		static_assert(std::is_same_v<decltype(ints * 2)::value_type, int>);
		static_assert(std::is_same_v<decltype(ints + 0.5)::value_type, double>);
		static_assert(std::is_same_v<decltype(ints + a)::value_type, double>);
		static_assert(std::is_same_v<decltype(cos(ints))::value_type, double>);

		auto asBool = mapCell(ints, [](int v) { return v > 2; });
		static_assert(std::is_same_v<decltype(asBool)::value_type, bool>);
		EXPECT_FALSE(asBool(1, 0));
		EXPECT_TRUE(asBool(0, 1));

		EXPECT_EQ((ints + 0.5)(0, 0), 1.5);
	}

	TEST_F(LazyRasterTest, EndToEnd) {
		LazyRaster<int> r = rasterFromRows<int>({ {1, 2}, {3, 4} });
		auto out = (r * 2) + 1;
		EXPECT_EQ(out(0, 0), 3);
		EXPECT_EQ(out(1, 0), 5);
		EXPECT_EQ(out(0, 1), 7);
		EXPECT_EQ(out(1, 1), 9);
	}

	TEST_F(LazyRasterTest, EvaluatorFaultsPropagate) {
		auto throwing = mapCell(a, [](double v)->double {
			if (v > 3) {
				throw std::domain_error("too big");
			}
			return v;
			});
		auto downstream = throwing + b;
		EXPECT_NO_THROW(downstream(0, 0));
		EXPECT_THROW(downstream(1, 1), std::domain_error);
	}

	TEST_F(LazyRasterTest, OperandsAreShared) {
		LazyRaster<double> copy = a;
		EXPECT_EQ(copy.evaluator(), a.evaluator());

		auto first = a + 1.;
		auto second = a * b;
		auto third = first - second;
		EXPECT_EQ(a(1, 1), 4);
		EXPECT_EQ(first(1, 1), 5);
		EXPECT_EQ(second(1, 1), 32);
		EXPECT_EQ(third(1, 1), -27);
	}

	TEST_F(LazyRasterTest, DerivedRastersOutliveLocalOperands) {
		LazyRaster<double> derived = a;
		{
			LazyRaster<double> local = rasterFromRows<double>({ {10, 20}, {30, 40} });
			derived = local + a;
		}
		EXPECT_EQ(derived(1, 1), 44);
	}
}
