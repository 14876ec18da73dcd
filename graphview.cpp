// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/graphview.h>

using namespace SimpleEasingPlot;

GraphView::GraphView(const std::string& name, EasingFunc func, const GraphSettings& settings, unsigned int size):
	scr(size, size), inst(*this, scr, name, func, settings)
{
	this->set_size_request(size, size);
	this->add_events(Gdk::POINTER_MOTION_MASK | Gdk::ENTER_NOTIFY_MASK | Gdk::LEAVE_NOTIFY_MASK);
}

GraphView::~GraphView()
{
	this->inst.dispose();
}

gint64 GraphView::now() const
{
	return g_get_monotonic_time(); //the same clock as frame times
}

unsigned int GraphView::add_tick(const SlotFrame& slot)
{
	return this->add_tick_callback(sigc::bind(sigc::mem_fun(*this, &GraphView::on_tick), slot));
}

void GraphView::remove_tick(unsigned int id)
{
	this->remove_tick_callback(id);
}

bool GraphView::is_pointer_inside() const
{
	return this->flag_inside;
}

void GraphView::present()
{
	this->queue_draw();
}

/*------------------------------ private functions ------------------------------*/

bool GraphView::on_tick(const Glib::RefPtr<Gdk::FrameClock>& frame_clock, SlotFrame slot)
{
	return slot(frame_clock->get_frame_time());
}

void GraphView::on_map()
{
	Gtk::DrawingArea::on_map();
	if (!this->inst.is_started() && !this->inst.is_disposed())
		this->inst.start();
}

bool GraphView::on_draw(const Cairo::RefPtr<Cairo::Context>& cr)
{
	cr->set_source(this->scr.front(), 0, 0);
	cr->paint();
	return true;
}

bool GraphView::on_motion_notify_event(GdkEventMotion* event)
{
	if (! this->flag_inside) {
		this->flag_inside = true; this->sig_enter.emit();
	}
	this->sig_move.emit(event->x, event->y);
	return false;
}

bool GraphView::on_enter_notify_event(GdkEventCrossing* event)
{
	this->flag_inside = true;
	this->sig_enter.emit();
	this->sig_move.emit(event->x, event->y);
	return false;
}

bool GraphView::on_leave_notify_event(GdkEventCrossing* event)
{
	this->flag_inside = false;
	this->sig_leave.emit();
	return false;
}
