// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_GRAPH_BOARD_H
#define SIMPLE_EASING_PLOT_GRAPH_BOARD_H

#include <vector>

#include <gtkmm/scrolledwindow.h>
#include <gtkmm/flowbox.h>

#include <simple-easing-plot/graphview.h>

namespace SimpleEasingPlot
{

// one framed graph per easing entry, laid out in a wrapping flow. a graph whose screen
// can't be set up is reported and left out; the others are unaffected.
class GraphBoard: public Gtk::ScrolledWindow
{
	const GraphSettings& settings;
	unsigned int graph_size;

	Gtk::FlowBox flowbox;
	std::vector<GraphView*> views; //managed by their parent boxes

	bool add_graph(const EasingEntry& entry);

public:
	GraphBoard(const GraphSettings& settings, const std::vector<EasingEntry>& entries,
	           unsigned int graph_size = Screen::Size_Default);
	GraphBoard(const GraphBoard&) = delete;
	GraphBoard& operator=(const GraphBoard&) = delete;

	unsigned int count() const; //graphs that have been set up
	GraphView& view(unsigned int index) const; //throws std::out_of_range
	void restart_all();
};

inline unsigned int GraphBoard::count() const
{
	return this->views.size();
}

}
#endif

