// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <vector>

#include <gtest/gtest.h>

#include <simple-easing-plot/nearestpoint.h>

using namespace SimpleEasingPlot;

TEST(ClosestCoordinateTest, NullInputs)
{
	CoordinateList coords = {Coordinate(0, 0), Coordinate(1, 1)};
	EXPECT_FALSE(closest_coordinate(coords, OptionalCoordinate()));
	EXPECT_FALSE(closest_coordinate(CoordinateList(), Coordinate(0.5, 0.5)));
}

TEST(ClosestCoordinateTest, MinimumDistance)
{
	CoordinateList coords = {Coordinate(0, 0), Coordinate(0.3, 0.6), Coordinate(0.6, 0.9), Coordinate(1, 1)};

	EXPECT_EQ(closest_coordinate(coords, Coordinate(0.35, 0.5)), OptionalCoordinate(coords[1]));
	EXPECT_EQ(closest_coordinate(coords, Coordinate(2, 2)), OptionalCoordinate(coords[3]));
	EXPECT_EQ(closest_coordinate(coords, Coordinate(0.6, 0.9)), OptionalCoordinate(coords[2])); //distance 0
	EXPECT_EQ(closest_coordinate(coords, Coordinate(-0.1, -0.5)), OptionalCoordinate(coords[0]));
}

TEST(ClosestCoordinateTest, FirstOfEquallyClose)
{
	CoordinateList coords = {Coordinate(0.25, 0.5), Coordinate(0.75, 0.5), Coordinate(0.5, 0.5)};
	OptionalCoordinate result = closest_coordinate(coords, Coordinate(0.5, 0.625));
	EXPECT_EQ(result, OptionalCoordinate(coords[2]));

	coords.pop_back();
	result = closest_coordinate(coords, Coordinate(0.5, 0.5));
	EXPECT_EQ(result, OptionalCoordinate(coords[0]));
}

class NearestPointResolverTest: public ::testing::Test
{
protected:
	ReplaySignal<CoordinateList> points;
	ReplaySignal<OptionalCoordinate> pointer;
	std::vector<OptionalCoordinate> emitted;

	void on_highlight(const OptionalCoordinate& coord) {emitted.push_back(coord);}
};

TEST_F(NearestPointResolverTest, WaitsForBothInputs)
{
	NearestPointResolver resolver(points, pointer);
	resolver.highlight().connect(sigc::mem_fun(*this, &NearestPointResolverTest::on_highlight));
	resolver.start();

	points.emit(CoordinateList(1, Coordinate(0, 0)));
	EXPECT_TRUE(emitted.empty());
	EXPECT_EQ(resolver.count_resolved(), 0u);

	pointer.emit(Coordinate(0.1, 0.1));
	ASSERT_EQ(emitted.size(), 1u);
	EXPECT_EQ(emitted[0], OptionalCoordinate(Coordinate(0, 0)));
}

TEST_F(NearestPointResolverTest, SuppressesUnchangedResult)
{
	points.emit(CoordinateList(1, Coordinate(0, 0)));
	pointer.emit(Coordinate(0.9, 0.9));

	NearestPointResolver resolver(points, pointer);
	resolver.highlight().connect(sigc::mem_fun(*this, &NearestPointResolverTest::on_highlight));
	resolver.start(); //both inputs replayed

	ASSERT_EQ(emitted.size(), 1u);
	EXPECT_EQ(emitted[0], OptionalCoordinate(Coordinate(0, 0)));

	pointer.emit(Coordinate(0.8, 0.8)); //still closest to the same point
	EXPECT_EQ(emitted.size(), 1u);

	points.edit().push_back(Coordinate(1, 1)); points.emit();
	ASSERT_EQ(emitted.size(), 2u);
	EXPECT_EQ(emitted[1], OptionalCoordinate(Coordinate(1, 1)));
	EXPECT_GE(resolver.count_resolved(), 4u);
}

TEST_F(NearestPointResolverTest, PointerLeaveGivesNull)
{
	NearestPointResolver resolver(points, pointer);
	resolver.start();
	points.emit(CoordinateList(1, Coordinate(0.5, 0.5)));
	pointer.emit(Coordinate(0.4, 0.4));
	ASSERT_TRUE(resolver.highlight().value());

	pointer.emit(OptionalCoordinate());
	EXPECT_FALSE(resolver.highlight().value());
}

TEST_F(NearestPointResolverTest, OnlyAccumulatedPoints)
{
	NearestPointResolver resolver(points, pointer);
	resolver.start();
	pointer.emit(Coordinate(0.5, 0.5));

	CoordinateList& pts = points.edit();
	for (int i = 0; i <= 10; i++) {
		pts.push_back(Coordinate(i / 10.0, (i / 10.0) * (i / 10.0)));
		points.emit();

		const OptionalCoordinate& hl = resolver.highlight().value();
		ASSERT_TRUE(hl);
		bool found = false;
		for (const Coordinate& pt : points.value())
			if (pt == hl.get()) found = true;
		EXPECT_TRUE(found);
	}
}

TEST_F(NearestPointResolverTest, CancelStopsResolving)
{
	NearestPointResolver resolver(points, pointer);
	resolver.start();
	points.emit(CoordinateList(1, Coordinate(0, 0)));
	pointer.emit(Coordinate(0, 0));
	unsigned long int cnt = resolver.count_resolved();

	resolver.cancel();
	pointer.emit(Coordinate(1, 1));
	EXPECT_EQ(resolver.count_resolved(), cnt);
	EXPECT_TRUE(points.empty());
}
