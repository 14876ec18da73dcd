// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/nearestpoint.h>

using namespace SimpleEasingPlot;

OptionalCoordinate SimpleEasingPlot::closest_coordinate(const CoordinateList& coords, const OptionalCoordinate& pivot)
{
	if (!pivot || coords.empty()) return OptionalCoordinate();

	const Coordinate& pv = pivot.get();
	unsigned int i_min = 0; double dist_min = coords[0].distance(pv);
	for (unsigned int i = 1; i < coords.size(); i++) {
		double dist = coords[i].distance(pv);
		if (dist < dist_min) {
			dist_min = dist; i_min = i;
		}
	}
	return coords[i_min];
}

NearestPointResolver::NearestPointResolver(ReplaySignal<CoordinateList>& points,
                                           ReplaySignal<OptionalCoordinate>& pointer):
	points(points), pointer(pointer)
{}

NearestPointResolver::~NearestPointResolver()
{
	this->cancel();
}

void NearestPointResolver::start()
{
	if (this->flag_cancelled || this->conn_points.connected()) return;

	// both are replayed if they already hold values
	this->conn_points = this->points.connect(sigc::mem_fun(*this, &NearestPointResolver::on_points));
	this->conn_pointer = this->pointer.connect(sigc::mem_fun(*this, &NearestPointResolver::on_pointer));
}

void NearestPointResolver::cancel()
{
	if (this->flag_cancelled) return;
	this->flag_cancelled = true;
	this->conn_points.disconnect();
	this->conn_pointer.disconnect();
}

/*------------------------------ private functions ------------------------------*/

void NearestPointResolver::on_points(const CoordinateList& coords)
{
	this->resolve();
}

void NearestPointResolver::on_pointer(const OptionalCoordinate& coord)
{
	this->resolve();
}

void NearestPointResolver::resolve()
{
	if (this->flag_cancelled) return;
	if (!this->points.has_value() || !this->pointer.has_value()) return;

	OptionalCoordinate closest = closest_coordinate(this->points.value(), this->pointer.value());
	this->cnt_resolved++;

	if (this->sig_highlight.has_value() && this->sig_highlight.value() == closest) return;
	this->sig_highlight.emit(closest);
}
