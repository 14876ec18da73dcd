// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <stdexcept>

#include <gtest/gtest.h>

#include <simple-easing-plot/framesource.h>

#include "testhost.h"

using namespace SimpleEasingPlot;

class FrameSourceTest: public ::testing::Test
{
protected:
	TestHost host;
	CurveGenerator gen = CurveGenerator(AnimationOptions(0, 100, 1000, &Easing::out_quad));
	CoordinateList points;
	unsigned int cnt_done = 0;

	void on_point(const Coordinate& pt) {points.push_back(pt);}
	void on_done() {cnt_done++;}

	void connect(FrameSource& source)
	{
		source.signal_point().connect(sigc::mem_fun(*this, &FrameSourceTest::on_point));
		source.signal_done().connect(sigc::mem_fun(*this, &FrameSourceTest::on_done));
	}
};

TEST_F(FrameSourceTest, LazyStart)
{
	FrameSource source(host, gen);
	connect(source);

	EXPECT_EQ(host.count_ticks(), 0u);
	host.advance(16);
	EXPECT_TRUE(points.empty());

	source.start();
	EXPECT_TRUE(source.is_started());
	EXPECT_EQ(host.count_ticks(), 1u);
	ASSERT_EQ(points.size(), 1u);
	EXPECT_EQ(points[0], Coordinate(0, 0)); //synthetic start point
}

TEST_F(FrameSourceTest, RunsToEndPoint)
{
	FrameSource source(host, gen);
	connect(source);
	source.start();
	host.run_until_idle(16.7);

	EXPECT_TRUE(source.is_finished());
	EXPECT_EQ(cnt_done, 1u);
	EXPECT_EQ(host.count_ticks(), 0u);

	// start point, one point per frame below 1000 ms, end point
	ASSERT_EQ(points.size(), 61u);
	EXPECT_EQ(points.back(), Coordinate(1, 1));
	EXPECT_EQ(source.count(), points.size());
	for (unsigned int i = 1; i < points.size(); i++)
		EXPECT_LE(points[i - 1].x, points[i].x);
	for (unsigned int i = 0; i + 1 < points.size(); i++)
		EXPECT_LT(points[i].x, 1);
}

TEST_F(FrameSourceTest, EndPointDespiteJitter)
{
	FrameSource source(host, gen);
	connect(source);
	source.start();

	host.advance(300); host.advance(0); host.advance(650);
	host.advance(1000); //far beyond the duration

	EXPECT_TRUE(source.is_finished());
	ASSERT_EQ(points.size(), 5u);
	EXPECT_EQ(points[1], points[2]); //a repeated frame time gives the same point
	EXPECT_EQ(points.back(), Coordinate(1, 1));
}

TEST_F(FrameSourceTest, CancelDetachesSynchronously)
{
	FrameSource source(host, gen);
	connect(source);
	source.start();
	host.advance(100);

	source.cancel();
	EXPECT_TRUE(source.is_cancelled());
	EXPECT_EQ(host.count_ticks(), 0u);

	unsigned int cnt = points.size();
	host.advance(100); host.advance(1000);
	EXPECT_EQ(points.size(), cnt);
	EXPECT_EQ(cnt_done, 0u);
	EXPECT_THROW(source.start(), std::runtime_error);
}

TEST_F(FrameSourceTest, IndependentTimelines)
{
	FrameSource first(host, gen);
	first.start();
	host.advance(400);

	FrameSource second(host, gen);
	connect(second);
	second.start();
	host.advance(100);

	EXPECT_DOUBLE_EQ(first.elapsed(), 500);
	EXPECT_DOUBLE_EQ(second.elapsed(), 100);
	ASSERT_EQ(points.size(), 2u);
	EXPECT_DOUBLE_EQ(points[1].x, 0.1);
}

TEST_F(FrameSourceTest, DestructionRemovesTick)
{
	{
		FrameSource source(host, gen);
		source.start();
		EXPECT_EQ(host.count_ticks(), 1u);
	}
	EXPECT_EQ(host.count_ticks(), 0u);
	host.advance(16); //nothing to call
}
