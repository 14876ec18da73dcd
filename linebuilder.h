// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_LINE_BUILDER_H
#define SIMPLE_EASING_PLOT_LINE_BUILDER_H

#include <simple-easing-plot/runstate.h>

namespace SimpleEasingPlot
{

// turns the live point stream into the growing segment list of a GraphRunState.
// for every pushed point, the point list is emitted first, then (from the second
// point on) the segment list, so a segment is never seen before its end point.
class LineBuilder
{
public:
	LineBuilder(GraphRunState& state);

	void push(const Coordinate& point); //throws std::invalid_argument if x decreases
	unsigned long int count_pushed() const;

private:
	GraphRunState& state;
	unsigned long int cnt_pushed = 0;
};

inline unsigned long int LineBuilder::count_pushed() const
{
	return this->cnt_pushed;
}

}
#endif

