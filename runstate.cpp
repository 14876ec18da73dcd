// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/runstate.h>

using namespace SimpleEasingPlot;

const CoordinateList GraphRunState::Empty_Points;
const LineList GraphRunState::Empty_Lines;

GraphRunState::GraphRunState() {}

const CoordinateList& GraphRunState::point_list() const
{
	if (! this->sig_points.has_value()) return Empty_Points;
	return this->sig_points.value();
}

const LineList& GraphRunState::line_list() const
{
	if (! this->sig_lines.has_value()) return Empty_Lines;
	return this->sig_lines.value();
}

const LineList& GraphRunState::optimal_list() const
{
	if (! this->sig_optimal.has_value()) return Empty_Lines;
	return this->sig_optimal.value();
}

bool GraphRunState::is_complete() const
{
	const CoordinateList& pts = this->point_list();
	return !pts.empty() && pts.back() == Coordinate(1, 1);
}

void GraphRunState::clear()
{
	this->sig_points.reset();
	this->sig_lines.reset();
	this->sig_optimal.reset();
}
