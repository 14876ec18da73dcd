// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <vector>

#include <gtest/gtest.h>

#include <simple-easing-plot/pointertracker.h>

#include "testhost.h"

using namespace SimpleEasingPlot;

class PointerTrackerTest: public ::testing::Test
{
protected:
	TestHost host;
	Graph graph = Graph(300, 300);
	std::vector<OptionalCoordinate> emitted;

	void on_coord(const OptionalCoordinate& coord) {emitted.push_back(coord);}
};

TEST_F(PointerTrackerTest, NullBeforeFirstEnter)
{
	PointerTracker tracker(host, graph);
	tracker.coordinate().connect(sigc::mem_fun(*this, &PointerTrackerTest::on_coord));
	tracker.start();

	ASSERT_EQ(emitted.size(), 1u); //replayed
	EXPECT_FALSE(emitted[0]);

	host.move(100, 100); //not entered yet
	EXPECT_EQ(emitted.size(), 1u);
}

TEST_F(PointerTrackerTest, MapsPixelsThroughGraph)
{
	PointerTracker tracker(host, graph);
	tracker.start();
	tracker.coordinate().connect(sigc::mem_fun(*this, &PointerTrackerTest::on_coord), false);

	host.enter();
	EXPECT_TRUE(emitted.empty()); //null until the first move
	host.move(graph.x.max, graph.y.max);

	ASSERT_EQ(emitted.size(), 1u);
	ASSERT_TRUE(emitted[0]);
	EXPECT_DOUBLE_EQ(emitted[0].get().x, 1);
	EXPECT_DOUBLE_EQ(emitted[0].get().y, 1);
}

TEST_F(PointerTrackerTest, NotClamped)
{
	PointerTracker tracker(host, graph);
	tracker.start();
	host.enter();
	host.move(299, 299); //below the x axis, right of x = 1

	const OptionalCoordinate& coord = tracker.coordinate().value();
	ASSERT_TRUE(coord);
	EXPECT_GT(coord.get().x, 1);
	EXPECT_LT(coord.get().y, 0);
}

TEST_F(PointerTrackerTest, DistinctUntilChanged)
{
	PointerTracker tracker(host, graph);
	tracker.start();
	tracker.coordinate().connect(sigc::mem_fun(*this, &PointerTrackerTest::on_coord), false);

	host.enter();
	host.move(50, 60); host.move(50, 60); host.move(51, 60);
	EXPECT_EQ(emitted.size(), 2u);

	host.leave(); host.leave();
	ASSERT_EQ(emitted.size(), 3u);
	EXPECT_FALSE(emitted.back());
	EXPECT_FALSE(tracker.is_inside());
}

TEST_F(PointerTrackerTest, AlreadyInsideOnStart)
{
	host.enter();
	PointerTracker tracker(host, graph);
	tracker.start();
	EXPECT_TRUE(tracker.is_inside());
	EXPECT_FALSE(tracker.coordinate().value());

	host.move(150, 150);
	EXPECT_TRUE(tracker.coordinate().value());
}

TEST_F(PointerTrackerTest, CancelDetaches)
{
	PointerTracker tracker(host, graph);
	tracker.start();
	tracker.coordinate().connect(sigc::mem_fun(*this, &PointerTrackerTest::on_coord), false);
	host.enter(); host.move(10, 10);
	ASSERT_EQ(emitted.size(), 1u);

	tracker.cancel();
	host.move(20, 20); host.leave();
	EXPECT_EQ(emitted.size(), 1u);
	EXPECT_TRUE(tracker.is_cancelled());
}
