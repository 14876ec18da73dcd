// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <stdexcept>

#include <gtest/gtest.h>

#include <simple-easing-plot/axis.h>

using namespace SimpleEasingPlot;

TEST(AxisTest, DerivedFromSurfaceSize)
{
	Graph graph(300, 300);

	EXPECT_DOUBLE_EQ(graph.x.offset, 15);
	EXPECT_DOUBLE_EQ(graph.x.min, 15);
	EXPECT_DOUBLE_EQ(graph.x.edge, 294);
	EXPECT_DOUBLE_EQ(graph.x.max, 274);
	EXPECT_DOUBLE_EQ(graph.x.delta, 259);

	EXPECT_DOUBLE_EQ(graph.y.offset, 24);
	EXPECT_DOUBLE_EQ(graph.y.min, 276);
	EXPECT_DOUBLE_EQ(graph.y.edge, 15);
	EXPECT_DOUBLE_EQ(graph.y.max, 38);
	EXPECT_LT(graph.y.delta, 0); //y grows upwards
}

TEST(AxisTest, EqualEndsRejected)
{
	EXPECT_THROW(Axis(10, 10, 20, 5), std::invalid_argument);
}

TEST(AxisTest, OriginAndUnitPoint)
{
	Graph graph(300, 300);

	Coordinate origin = graph.absolute(Coordinate(0, 0));
	EXPECT_DOUBLE_EQ(origin.x, graph.x.min);
	EXPECT_DOUBLE_EQ(origin.y, graph.y.min);

	Coordinate unit = graph.normalize(graph.x.max, graph.y.max);
	EXPECT_DOUBLE_EQ(unit.x, 1);
	EXPECT_DOUBLE_EQ(unit.y, 1);
}

TEST(AxisTest, NormalizeAbsoluteRoundTrip)
{
	Graph graph(420, 260);
	const Coordinate coords[] = {
		Coordinate(0, 0), Coordinate(1, 1), Coordinate(0.37, 0.81),
		Coordinate(0.5, -0.3), Coordinate(0.9, 1.25) //overshooting values
	};
	for (const Coordinate& c : coords) {
		Coordinate back = graph.normalize(graph.absolute(c));
		EXPECT_NEAR(back.x, c.x, 1e-12);
		EXPECT_NEAR(back.y, c.y, 1e-12);
	}

	const Coordinate pixels[] = {Coordinate(0, 0), Coordinate(123.5, 77.25), Coordinate(419, 259)};
	for (const Coordinate& p : pixels) {
		Coordinate back = graph.absolute(graph.normalize(p));
		EXPECT_NEAR(back.x, p.x, 1e-9);
		EXPECT_NEAR(back.y, p.y, 1e-9);
	}
}

TEST(AxisTest, OptionalCoordinate)
{
	OptionalCoordinate null_coord, coord(Coordinate(0.25, 0.5));

	EXPECT_FALSE(null_coord);
	EXPECT_TRUE(coord);
	EXPECT_THROW(null_coord.get(), std::logic_error);
	EXPECT_EQ(coord.get(), Coordinate(0.25, 0.5));

	EXPECT_EQ(null_coord, OptionalCoordinate());
	EXPECT_NE(null_coord, coord);
	EXPECT_NE(coord, OptionalCoordinate(Coordinate(0.25, 0.75)));
}

TEST(AxisTest, Distance)
{
	EXPECT_DOUBLE_EQ(Coordinate(0, 0).distance(Coordinate(3, 4)), 5);
	EXPECT_DOUBLE_EQ(Coordinate(0.5, 0.5).distance(Coordinate(0.5, 0.5)), 0);
}
