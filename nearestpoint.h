// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_NEAREST_POINT_H
#define SIMPLE_EASING_PLOT_NEAREST_POINT_H

#include <simple-easing-plot/axis.h>
#include <simple-easing-plot/replaysignal.h>

namespace SimpleEasingPlot
{

// the point closest to the pivot (the first one among equally close points);
// null if the pivot is null or the list is empty
OptionalCoordinate closest_coordinate(const CoordinateList& coords, const OptionalCoordinate& pivot);

// combines the latest accumulated points with the latest pointer coordinate. it resolves
// again whenever either changes (once both have a value) and emits only when the
// resolved coordinate differs from the previous one.
class NearestPointResolver
{
public:
	NearestPointResolver(ReplaySignal<CoordinateList>& points, ReplaySignal<OptionalCoordinate>& pointer);
	NearestPointResolver(const NearestPointResolver&) = delete;
	NearestPointResolver& operator=(const NearestPointResolver&) = delete;
	~NearestPointResolver(); //cancels

	ReplaySignal<OptionalCoordinate>& highlight();
	const ReplaySignal<OptionalCoordinate>& highlight() const;

	void start();
	void cancel();
	unsigned long int count_resolved() const; //including the suppressed results

private:
	ReplaySignal<CoordinateList>& points;
	ReplaySignal<OptionalCoordinate>& pointer;
	ReplaySignal<OptionalCoordinate> sig_highlight;

	sigc::connection conn_points, conn_pointer;
	unsigned long int cnt_resolved = 0;
	bool flag_cancelled = false;

	void on_points(const CoordinateList& coords);
	void on_pointer(const OptionalCoordinate& coord);
	void resolve();
};

inline ReplaySignal<OptionalCoordinate>& NearestPointResolver::highlight()
{
	return this->sig_highlight;
}

inline const ReplaySignal<OptionalCoordinate>& NearestPointResolver::highlight() const
{
	return this->sig_highlight;
}

inline unsigned long int NearestPointResolver::count_resolved() const
{
	return this->cnt_resolved;
}

}
#endif

