// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_POINTER_TRACKER_H
#define SIMPLE_EASING_PLOT_POINTER_TRACKER_H

#include <vector>

#include <sigc++/sigc++.h>

#include <simple-easing-plot/axis.h>
#include <simple-easing-plot/replaysignal.h>

namespace SimpleEasingPlot
{
class PointerSource; class PointerTracker;

// raw pointer events of a graph's drawing surface, in device pixels
class PointerSource
{
public:
	virtual ~PointerSource() {}

	virtual bool is_pointer_inside() const = 0;

	sigc::signal<void()> signal_pointer_enter();
	sigc::signal<void(double, double)> signal_pointer_move();
	sigc::signal<void()> signal_pointer_leave();

protected:
	sigc::signal<void()> sig_enter, sig_leave;
	sigc::signal<void(double, double)> sig_move;
};

// maps pointer events into graph-normalized coordinates. the coordinate is null before
// the first enter and after a leave; moves outside an enter-leave pair are ignored.
// coordinates are not clamped, and an unchanged value is not emitted again.
class PointerTracker
{
public:
	PointerTracker(PointerSource& source, const Graph& graph);
	PointerTracker(const PointerTracker&) = delete;
	PointerTracker& operator=(const PointerTracker&) = delete;
	~PointerTracker(); //cancels

	ReplaySignal<OptionalCoordinate>& coordinate(); //holds null from the beginning
	const ReplaySignal<OptionalCoordinate>& coordinate() const;

	void start(); //subscribes to the source; enters at once if the pointer is inside already
	void cancel();

	void enter();
	void move(double pixel_x, double pixel_y);
	void leave();

	bool is_inside() const;
	bool is_cancelled() const;

private:
	PointerSource& source;
	Graph graph;

	ReplaySignal<OptionalCoordinate> sig_coord;
	std::vector<sigc::connection> conns;
	bool flag_inside = false, flag_cancelled = false;

	void emit_distinct(const OptionalCoordinate& coord);
};

inline sigc::signal<void()> PointerSource::signal_pointer_enter()
{
	return this->sig_enter;
}

inline sigc::signal<void(double, double)> PointerSource::signal_pointer_move()
{
	return this->sig_move;
}

inline sigc::signal<void()> PointerSource::signal_pointer_leave()
{
	return this->sig_leave;
}

inline ReplaySignal<OptionalCoordinate>& PointerTracker::coordinate()
{
	return this->sig_coord;
}

inline const ReplaySignal<OptionalCoordinate>& PointerTracker::coordinate() const
{
	return this->sig_coord;
}

inline bool PointerTracker::is_inside() const
{
	return this->flag_inside;
}

inline bool PointerTracker::is_cancelled() const
{
	return this->flag_cancelled;
}

}
#endif

