// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_GRAPH_VIEW_H
#define SIMPLE_EASING_PLOT_GRAPH_VIEW_H

#include <string>

#include <gdkmm/frameclock.h>
#include <gtkmm/drawingarea.h>

#include <simple-easing-plot/graphinstance.h>

namespace SimpleEasingPlot
{

// hosts one graph instance: its frame clock is the widget's tick callback, its pointer
// events are the widget's motion and crossing events. the graph starts when the widget
// is mapped for the first time.
class GraphView: public Gtk::DrawingArea, public GraphHost
{
	Screen scr; //constructed before the instance
	GraphInstance inst;
	bool flag_inside = false;

	bool on_tick(const Glib::RefPtr<Gdk::FrameClock>& frame_clock, SlotFrame slot);

	// inherits Gtk::Widget
	void on_map() override;
	bool on_draw(const Cairo::RefPtr<Cairo::Context>& cr) override;
	bool on_motion_notify_event(GdkEventMotion* event) override;
	bool on_enter_notify_event(GdkEventCrossing* event) override;
	bool on_leave_notify_event(GdkEventCrossing* event) override;

public:
	GraphView(const std::string& name, EasingFunc func, const GraphSettings& settings,
	          unsigned int size = Screen::Size_Default); //throws
	GraphView(const GraphView&) = delete;
	GraphView& operator=(const GraphView&) = delete;
	virtual ~GraphView();

	GraphInstance& instance();
	void restart();

	// implements GraphHost
	gint64 now() const override;
	unsigned int add_tick(const SlotFrame& slot) override;
	void remove_tick(unsigned int id) override;
	bool is_pointer_inside() const override;
	void present() override;
};

inline GraphInstance& GraphView::instance()
{
	return this->inst;
}

inline void GraphView::restart()
{
	this->inst.restart();
}

}
#endif

