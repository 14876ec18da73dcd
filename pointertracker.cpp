// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/pointertracker.h>

using namespace SimpleEasingPlot;

PointerTracker::PointerTracker(PointerSource& source, const Graph& graph):
	source(source), graph(graph)
{
	this->sig_coord.emit(OptionalCoordinate());
}

PointerTracker::~PointerTracker()
{
	this->cancel();
}

void PointerTracker::start()
{
	if (this->flag_cancelled || !this->conns.empty()) return;

	this->conns.push_back(this->source.signal_pointer_enter().connect(
		sigc::mem_fun(*this, &PointerTracker::enter)));
	this->conns.push_back(this->source.signal_pointer_move().connect(
		sigc::mem_fun(*this, &PointerTracker::move)));
	this->conns.push_back(this->source.signal_pointer_leave().connect(
		sigc::mem_fun(*this, &PointerTracker::leave)));

	if (this->source.is_pointer_inside()) this->enter();
}

void PointerTracker::cancel()
{
	if (this->flag_cancelled) return;
	this->flag_cancelled = true;

	for (sigc::connection& conn : this->conns)
		conn.disconnect();
	this->conns.clear();
}

void PointerTracker::enter()
{
	if (this->flag_cancelled) return;
	this->flag_inside = true; //the coordinate stays null until the first move
}

void PointerTracker::move(double pixel_x, double pixel_y)
{
	if (this->flag_cancelled || !this->flag_inside) return;
	this->emit_distinct(this->graph.normalize(pixel_x, pixel_y));
}

void PointerTracker::leave()
{
	if (this->flag_cancelled) return;
	this->flag_inside = false;
	this->emit_distinct(OptionalCoordinate());
}

/*------------------------------ private functions ------------------------------*/

void PointerTracker::emit_distinct(const OptionalCoordinate& coord)
{
	if (this->sig_coord.has_value() && this->sig_coord.value() == coord) return;
	this->sig_coord.emit(coord);
}
