// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/curve.h>

#include <cmath> //floor()
#include <stdexcept>

using namespace SimpleEasingPlot;

void AnimationOptions::check() const
{
	if (this->duration == 0)
		throw std::invalid_argument("AnimationOptions::check(): duration must be positive.");
	if (this->to == 0)
		throw std::invalid_argument("AnimationOptions::check(): target value 0 can't be normalized.");
	if (! this->easing)
		throw std::invalid_argument("AnimationOptions::check(): the easing function is null.");
}

CurveGenerator::CurveGenerator(const AnimationOptions& opt): opt(opt)
{
	this->opt.check();
	this->delta = opt.value_delta();
}

Coordinate CurveGenerator::point(double elapsed) const
{
	double duration = this->opt.duration;

	// both ends are pinned, some equations only reach them approximately
	if (elapsed == 0) return Coordinate(0, this->opt.from / this->opt.to);
	if (elapsed == duration) return end_point();

	return Coordinate(elapsed / duration,
	                  this->opt.easing(elapsed, this->opt.from, this->delta, duration) / this->opt.to);
}

std::string CurveGenerator::readout(const Coordinate& coord) const
{
	long int ms = (long int)std::floor(coord.x * this->opt.duration),
	         val = (long int)std::floor(coord.y * this->opt.to);
	return '(' + std::to_string(ms) + ", " + std::to_string(val) + ')';
}

LineList SimpleEasingPlot::optimal_reference(const CurveGenerator& gen)
{
	unsigned int duration = gen.options().duration;

	CoordinateList points; points.reserve(duration + 1);
	points.push_back(gen.start_point());
	for (unsigned int ms = 1; ms <= duration; ms++) {
		Coordinate pt = gen.point(ms);
		if (pt.x >= 1) break;
		points.push_back(pt);
	}
	points.push_back(CurveGenerator::end_point());

	return pairwise_lines(points);
}

LineList SimpleEasingPlot::pairwise_lines(const CoordinateList& points)
{
	LineList lines;
	if (points.size() < 2) return lines;

	lines.reserve(points.size() - 1);
	for (unsigned int i = 1; i < points.size(); i++)
		lines.push_back(Line(points[i - 1], points[i]));
	return lines;
}
