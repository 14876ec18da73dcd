// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_FRONTEND_H
#define SIMPLE_EASING_PLOT_FRONTEND_H

#include <string>
#include <vector>

#include <gtkmm/window.h>
#include <gtkmm/scale.h>
#include <gtkmm/label.h>
#include <gtkmm/checkbutton.h>

#include <simple-easing-plot/graphboard.h>

namespace SimpleEasingPlot
{

// the window: a control bar bound to the shared settings, and the board of graphs
class Frontend: public sigc::trackable
{
	using OptionSetter = void (GraphSettings::*)(bool);

	GraphSettings& settings;
	std::vector<EasingEntry> entries;
	unsigned int graph_size;

	Gtk::Window* window = NULL;
	GraphBoard* board = NULL;
	Gtk::Scale* scale_duration;
	Gtk::Label* label_duration;

	void create_window();
	Gtk::CheckButton* create_check_button(const std::string& label, bool active, OptionSetter setter);

	void on_scale_duration_changed();
	void on_check_button_toggled(Gtk::CheckButton* button, OptionSetter setter);
	void on_button_restart_clicked();

public:
	std::string title = "Easing Functions";

	Frontend(GraphSettings& settings, const std::vector<EasingEntry>& entries,
	         unsigned int graph_size = Screen::Size_Default); //throws std::invalid_argument
	Frontend(const Frontend&) = delete;
	Frontend& operator=(const Frontend&) = delete;
	virtual ~Frontend();

	int run(); //blocks until the window is closed
};

}
#endif

