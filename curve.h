// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_CURVE_H
#define SIMPLE_EASING_PLOT_CURVE_H

#include <string>

#include <simple-easing-plot/axis.h>
#include <simple-easing-plot/easing.h>

namespace SimpleEasingPlot
{
struct AnimationOptions; class CurveGenerator;

// fixed for the lifetime of one run
struct AnimationOptions
{
	double from = 0, to = 100;
	unsigned int duration = 1000; //ms
	EasingFunc easing = NULL;

	AnimationOptions();
	AnimationOptions(double from, double to, unsigned int duration, EasingFunc easing);

	void check() const; //throws std::invalid_argument
	double value_delta() const;

	bool operator==(const AnimationOptions& opt) const;
	bool operator!=(const AnimationOptions& opt) const;
};

// maps elapsed time to a normalized coordinate. overshooting values are kept as they are.
class CurveGenerator
{
public:
	CurveGenerator(const AnimationOptions& opt); //throws std::invalid_argument

	const AnimationOptions& options() const;

	Coordinate point(double elapsed) const; //elapsed in ms
	Coordinate start_point() const; //at elapsed 0
	static Coordinate end_point(); //always (1, 1)

	// turns a normalized coordinate back into "(elapsed ms, value)"
	std::string readout(const Coordinate& coord) const;

private:
	AnimationOptions opt;
	double delta;
};

// samples the generator at every integer millisecond in [1, duration], prefixed by the
// start point and terminated by the end point. it doesn't depend on frame timing.
LineList optimal_reference(const CurveGenerator& gen);

// consecutive pairs of the points
LineList pairwise_lines(const CoordinateList& points);

inline AnimationOptions::AnimationOptions() {}

inline AnimationOptions::AnimationOptions(double from, double to, unsigned int duration, EasingFunc easing):
	from(from), to(to), duration(duration), easing(easing) {}

inline double AnimationOptions::value_delta() const
{
	return this->to >= this->from? this->to - this->from : this->from - this->to;
}

inline bool AnimationOptions::operator==(const AnimationOptions& opt) const
{
	return this->from == opt.from && this->to == opt.to
	    && this->duration == opt.duration && this->easing == opt.easing;
}

inline bool AnimationOptions::operator!=(const AnimationOptions& opt) const
{
	return !(*this == opt);
}

inline const AnimationOptions& CurveGenerator::options() const
{
	return this->opt;
}

inline Coordinate CurveGenerator::start_point() const
{
	return this->point(0);
}

inline Coordinate CurveGenerator::end_point()
{
	return Coordinate(1, 1);
}

}
#endif

