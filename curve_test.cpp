// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <stdexcept>

#include <gtest/gtest.h>

#include <simple-easing-plot/curve.h>

using namespace SimpleEasingPlot;

TEST(CurveTest, InvalidOptionsRejected)
{
	EXPECT_THROW(CurveGenerator(AnimationOptions(0, 100, 0, &Easing::in_quad)), std::invalid_argument);
	EXPECT_THROW(CurveGenerator(AnimationOptions(0, 0, 1000, &Easing::in_quad)), std::invalid_argument);
	EXPECT_THROW(CurveGenerator(AnimationOptions(0, 100, 1000, NULL)), std::invalid_argument);
	EXPECT_NO_THROW(CurveGenerator(AnimationOptions(0, 100, 1, &Easing::in_quad)));
}

TEST(CurveTest, EndsArePinnedForEveryEasing)
{
	const unsigned int durations[] = {1, 100, 333, 1000, 5000};
	for (const EasingEntry& entry : easing_catalogue()) {
		for (unsigned int d : durations) {
			CurveGenerator gen(AnimationOptions(0, 100, d, entry.func));
			EXPECT_EQ(gen.point(0), Coordinate(0, 0)) << entry.name << ", " << d << " ms";
			EXPECT_EQ(gen.point(d), Coordinate(1, 1)) << entry.name << ", " << d << " ms";
		}
	}
}

TEST(CurveTest, StartPointIsNormalizedStartValue)
{
	CurveGenerator gen(AnimationOptions(20, 100, 1000, &Easing::in_quad));
	EXPECT_EQ(gen.start_point(), Coordinate(0, 0.2));
	EXPECT_EQ(CurveGenerator::end_point(), Coordinate(1, 1));
}

TEST(CurveTest, Deterministic)
{
	CurveGenerator gen(AnimationOptions(0, 100, 1000, &Easing::in_out_elastic));
	Coordinate first = gen.point(437.5);
	for (int ms = 1; ms < 1000; ms += 7) gen.point(ms);
	EXPECT_EQ(gen.point(437.5), first);

	CurveGenerator other(AnimationOptions(0, 100, 1000, &Easing::in_out_elastic));
	EXPECT_EQ(other.point(437.5), first);
}

TEST(CurveTest, MapsElapsedToFractions)
{
	CurveGenerator gen(AnimationOptions(0, 100, 1000, &Easing::in_quad));
	Coordinate pt = gen.point(500);
	EXPECT_DOUBLE_EQ(pt.x, 0.5);
	EXPECT_DOUBLE_EQ(pt.y, 0.25);
}

TEST(CurveTest, OvershootNotClamped)
{
	CurveGenerator gen(AnimationOptions(0, 100, 1000, &Easing::in_back));
	EXPECT_LT(gen.point(200).y, 0);

	CurveGenerator gen_out(AnimationOptions(0, 100, 1000, &Easing::out_back));
	EXPECT_GT(gen_out.point(800).y, 1);
}

TEST(CurveTest, Readout)
{
	CurveGenerator gen(AnimationOptions(0, 100, 1000, &Easing::in_quad));
	EXPECT_EQ(gen.readout(Coordinate(0.5, 0.25)), "(500, 25)");
	EXPECT_EQ(gen.readout(Coordinate(0.2567, 0.0659)), "(256, 6)");
	EXPECT_EQ(gen.readout(Coordinate(1, 1)), "(1000, 100)");
	EXPECT_EQ(gen.readout(Coordinate(0.2, -0.0464)), "(200, -5)"); //floored
}

TEST(CurveTest, OptimalReferenceOfOutBounce)
{
	CurveGenerator gen(AnimationOptions(0, 100, 1000, &Easing::out_bounce));
	LineList lines = optimal_reference(gen);

	// start point, 999 samples below x = 1, end point
	ASSERT_EQ(lines.size(), 1000u);
	EXPECT_EQ(lines.front().from, Coordinate(0, 0));
	EXPECT_EQ(lines.back().to, Coordinate(1, 1));

	for (unsigned int i = 1; i < lines.size(); i++) {
		EXPECT_EQ(lines[i].from, lines[i - 1].to);
		EXPECT_LE(lines[i - 1].from.x, lines[i].from.x);
	}
	EXPECT_DOUBLE_EQ(lines[1].from.x, 0.001);
}

TEST(CurveTest, OptimalReferenceIsFrameIndependent)
{
	CurveGenerator gen(AnimationOptions(0, 100, 250, &Easing::in_out_quad));
	EXPECT_EQ(optimal_reference(gen), optimal_reference(gen));
	EXPECT_EQ(optimal_reference(gen).size(), 250u);
}

TEST(CurveTest, PairwiseLines)
{
	EXPECT_TRUE(pairwise_lines(CoordinateList()).empty());
	EXPECT_TRUE(pairwise_lines(CoordinateList(1, Coordinate(0, 0))).empty());

	CoordinateList pts = {Coordinate(0, 0), Coordinate(0.5, 0.3), Coordinate(1, 1)};
	LineList lines = pairwise_lines(pts);
	ASSERT_EQ(lines.size(), 2u);
	EXPECT_EQ(lines[0], Line(pts[0], pts[1]));
	EXPECT_EQ(lines[1], Line(pts[1], pts[2]));
}
