// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/linebuilder.h>

#include <stdexcept>

using namespace SimpleEasingPlot;

LineBuilder::LineBuilder(GraphRunState& state): state(state) {}

void LineBuilder::push(const Coordinate& point)
{
	ReplaySignal<CoordinateList>& points = this->state.points();
	ReplaySignal<LineList>& lines = this->state.lines();

	if (points.has_value() && !points.value().empty()
	&&  point.x < points.value().back().x)
		throw std::invalid_argument("LineBuilder::push(): x value of the point decreases.");

	CoordinateList& pts = points.edit();
	pts.push_back(point);
	this->cnt_pushed++;
	points.emit();

	if (pts.size() < 2) return;
	lines.edit().push_back(Line(pts[pts.size() - 2], pts.back()));
	lines.emit();
}
