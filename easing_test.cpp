// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <set>
#include <string>

#include <gtest/gtest.h>

#include <simple-easing-plot/easing.h>

using namespace SimpleEasingPlot;

TEST(EasingTest, CatalogueInDisplayOrder)
{
	const std::vector<EasingEntry>& catalogue = easing_catalogue();
	ASSERT_EQ(catalogue.size(), 30u);

	EXPECT_EQ(catalogue.front().name, "easeInQuad");
	EXPECT_EQ(catalogue[13].name, "easeOutSine");
	EXPECT_EQ(catalogue[24].name, "easeInBack");
	EXPECT_EQ(catalogue.back().name, "easeInOutBounce");

	std::set<std::string> names;
	for (const EasingEntry& entry : catalogue) {
		EXPECT_TRUE(entry.func != NULL) << entry.name;
		names.insert(entry.name);
	}
	EXPECT_EQ(names.size(), catalogue.size());
}

TEST(EasingTest, FindByName)
{
	EXPECT_EQ(find_easing("easeOutBounce"), &Easing::out_bounce);
	EXPECT_EQ(find_easing("easeInOutElastic"), &Easing::in_out_elastic);
	EXPECT_TRUE(find_easing("easeSideways") == NULL);
	EXPECT_TRUE(find_easing("") == NULL);
}

TEST(EasingTest, EndpointsOfEveryEquation)
{
	for (const EasingEntry& entry : easing_catalogue()) {
		EXPECT_NEAR(entry.func(0, 0, 100, 1000), 0, 1e-9) << entry.name;
		EXPECT_NEAR(entry.func(1000, 0, 100, 1000), 100, 1e-9) << entry.name;
		EXPECT_NEAR(entry.func(0, 20, 50, 700), 20, 1e-9) << entry.name;
	}
}

TEST(EasingTest, KnownValues)
{
	EXPECT_DOUBLE_EQ(Easing::in_quad(500, 0, 100, 1000), 25);
	EXPECT_DOUBLE_EQ(Easing::out_quad(500, 0, 100, 1000), 75);
	EXPECT_DOUBLE_EQ(Easing::in_out_cubic(500, 0, 100, 1000), 50);
	EXPECT_NEAR(Easing::in_out_sine(500, 0, 100, 1000), 50, 1e-9);
	EXPECT_NEAR(Easing::out_bounce(1000 / 2.75, 0, 100, 1000), 100, 1e-9); //first touch
}

TEST(EasingTest, OvershootIsKept)
{
	// back easings leave [start, start + delta] on purpose
	EXPECT_LT(Easing::in_back(200, 0, 100, 1000), 0);
	EXPECT_GT(Easing::out_back(800, 0, 100, 1000), 100);

	bool overshoot = false;
	for (int ms = 1; ms < 1000; ms++)
		if (Easing::out_elastic(ms, 0, 100, 1000) > 100) overshoot = true;
	EXPECT_TRUE(overshoot);
}
