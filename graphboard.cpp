// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/graphboard.h>

#include <stdexcept>

#include <gtkmm/box.h>
#include <gtkmm/button.h>
#include <gtkmm/frame.h>
#include <gtkmm/label.h>

using namespace SimpleEasingPlot;

GraphBoard::GraphBoard(const GraphSettings& settings, const std::vector<EasingEntry>& entries,
                       unsigned int graph_size):
	settings(settings), graph_size(graph_size)
{
	this->flowbox.set_selection_mode(Gtk::SELECTION_NONE);
	this->flowbox.set_homogeneous(true);
	this->flowbox.set_column_spacing(5); this->flowbox.set_row_spacing(5);
	this->flowbox.set_border_width(5);

	for (const EasingEntry& entry : entries)
		this->add_graph(entry);

	this->set_policy(Gtk::POLICY_NEVER, Gtk::POLICY_AUTOMATIC);
	this->add(this->flowbox);
	this->show_all_children();
}

GraphView& GraphBoard::view(unsigned int index) const
{
	if (index >= this->views.size())
		throw std::out_of_range("GraphBoard::view(): index out of range.");
	return *this->views[index];
}

void GraphBoard::restart_all()
{
	for (GraphView* view : this->views)
		view->restart();
}

/*------------------------------ private functions ------------------------------*/

bool GraphBoard::add_graph(const EasingEntry& entry)
{
	GraphView* view;
	try {
		view = Gtk::manage(new GraphView(entry.name, entry.func, this->settings, this->graph_size));
	} catch (const std::exception& ex) {
		g_critical("GraphBoard: graph %s is left out: %s", entry.name.c_str(), ex.what());
		return false;
	}

	Gtk::Label* label = Gtk::manage(new Gtk::Label(entry.name));
	label->set_halign(Gtk::ALIGN_START);

	Gtk::Button* button_restart = Gtk::manage(new Gtk::Button("Restart"));
	button_restart->signal_clicked().connect(sigc::mem_fun(*view, &GraphView::restart));

	Gtk::Box* header = Gtk::manage(new Gtk::Box(Gtk::ORIENTATION_HORIZONTAL)),
	        * box = Gtk::manage(new Gtk::Box(Gtk::ORIENTATION_VERTICAL));

	header->set_spacing(5);
	header->pack_start(*label, Gtk::PACK_EXPAND_WIDGET);
	header->pack_start(*button_restart, Gtk::PACK_SHRINK);

	box->set_border_width(5); box->set_spacing(5);
	box->pack_start(*header, Gtk::PACK_SHRINK);
	box->pack_start(*view, Gtk::PACK_SHRINK);

	Gtk::Frame* frame = Gtk::manage(new Gtk::Frame());
	frame->add(*box);
	this->flowbox.add(*frame);

	this->views.push_back(view);
	return true;
}
