// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_RUN_STATE_H
#define SIMPLE_EASING_PLOT_RUN_STATE_H

#include <simple-easing-plot/axis.h>
#include <simple-easing-plot/replaysignal.h>

namespace SimpleEasingPlot
{

// accumulated data of one run: the frame points, the segments between consecutive
// points and the optimal reference polyline. each list is held once and handed out
// to every consumer through its replaying signal.
class GraphRunState
{
public:
	GraphRunState();
	GraphRunState(const GraphRunState&) = delete;
	GraphRunState& operator=(const GraphRunState&) = delete;

	ReplaySignal<CoordinateList>& points();
	ReplaySignal<LineList>& lines();
	ReplaySignal<LineList>& optimal();

	unsigned int point_count() const;
	unsigned int line_count() const;
	const CoordinateList& point_list() const; //empty list if nothing is accumulated
	const LineList& line_list() const;
	const LineList& optimal_list() const;

	bool is_complete() const; //the last point is (1, 1)
	void clear(); //drops all lists at once, without notifying

private:
	ReplaySignal<CoordinateList> sig_points;
	ReplaySignal<LineList> sig_lines;
	ReplaySignal<LineList> sig_optimal;

	static const CoordinateList Empty_Points;
	static const LineList Empty_Lines;
};

inline ReplaySignal<CoordinateList>& GraphRunState::points()
{
	return this->sig_points;
}

inline ReplaySignal<LineList>& GraphRunState::lines()
{
	return this->sig_lines;
}

inline ReplaySignal<LineList>& GraphRunState::optimal()
{
	return this->sig_optimal;
}

inline unsigned int GraphRunState::point_count() const
{
	return this->point_list().size();
}

inline unsigned int GraphRunState::line_count() const
{
	return this->line_list().size();
}

}
#endif

