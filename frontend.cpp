// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/frontend.h>

#include <cmath> //round()
#include <stdexcept>

#include <gtkmm/application.h>
#include <gtkmm/box.h>
#include <gtkmm/button.h>

using namespace SimpleEasingPlot;

Frontend::Frontend(GraphSettings& settings, const std::vector<EasingEntry>& entries, unsigned int graph_size):
	settings(settings), entries(entries), graph_size(graph_size)
{
	if (entries.empty())
		throw std::invalid_argument("Frontend::Frontend(): no easing function is given.");
	if (graph_size < Screen::Size_Min)
		throw std::invalid_argument("Frontend::Frontend(): the graph size is too small.");
}

Frontend::~Frontend()
{
	delete this->window;
}

int Frontend::run()
{
	if (this->window) return 0; //running already

	Glib::RefPtr<Gtk::Application> app = Gtk::Application::create("org.simple-easing-plot.frontend",
	                                                               Gio::APPLICATION_NON_UNIQUE);
	this->create_window();
	g_debug("Frontend: %u graphs of %u px are shown.", this->board->count(), this->graph_size);

	int ret = app->run(*this->window);

	delete this->window; //the graphs are disposed with it
	this->window = NULL; this->board = NULL;
	return ret;
}

/*------------------------------ private functions ------------------------------*/

void Frontend::create_window()
{
	const RenderOptions& opt = this->settings.render_options();

	Glib::RefPtr<Gtk::Adjustment> adj = Gtk::Adjustment::create(
		this->settings.duration(), GraphSettings::Duration_Min, GraphSettings::Duration_Max,
		GraphSettings::Duration_Step, 5 * GraphSettings::Duration_Step, 0);
	this->scale_duration = Gtk::manage(new Gtk::Scale(adj, Gtk::ORIENTATION_HORIZONTAL));
	this->scale_duration->set_digits(0);
	this->scale_duration->set_draw_value(false);
	this->scale_duration->set_size_request(200, -1);
	this->scale_duration->signal_value_changed().connect(
		sigc::mem_fun(*this, &Frontend::on_scale_duration_changed));

	this->label_duration = Gtk::manage(new Gtk::Label(std::to_string(this->settings.duration()) + " ms"));
	this->label_duration->set_width_chars(8);

	Gtk::Button* button_restart = Gtk::manage(new Gtk::Button("Restart All"));
	button_restart->signal_clicked().connect(sigc::mem_fun(*this, &Frontend::on_button_restart_clicked));

	Gtk::Box* bar = Gtk::manage(new Gtk::Box(Gtk::ORIENTATION_HORIZONTAL));
	bar->set_border_width(5); bar->set_spacing(5);
	bar->pack_start(*this->scale_duration, Gtk::PACK_SHRINK);
	bar->pack_start(*this->label_duration, Gtk::PACK_SHRINK);
	bar->pack_start(*this->create_check_button("Points", opt.render_points,
		&GraphSettings::set_option_render_points), Gtk::PACK_SHRINK);
	bar->pack_start(*this->create_check_button("Coordinates", opt.render_coords,
		&GraphSettings::set_option_render_coords), Gtk::PACK_SHRINK);
	bar->pack_start(*this->create_check_button("Optimal", opt.render_optimal,
		&GraphSettings::set_option_render_optimal), Gtk::PACK_SHRINK);
	bar->pack_start(*this->create_check_button("Effective", opt.render_effective,
		&GraphSettings::set_option_render_effective), Gtk::PACK_SHRINK);
	bar->pack_start(*this->create_check_button("Frame Lines", opt.render_framelines,
		&GraphSettings::set_option_render_framelines), Gtk::PACK_SHRINK);
	bar->pack_end(*button_restart, Gtk::PACK_SHRINK);

	this->board = Gtk::manage(new GraphBoard(this->settings, this->entries, this->graph_size));

	Gtk::Box* box = Gtk::manage(new Gtk::Box(Gtk::ORIENTATION_VERTICAL));
	box->pack_start(*bar, Gtk::PACK_SHRINK);
	box->pack_start(*this->board, Gtk::PACK_EXPAND_WIDGET);

	this->window = new Gtk::Window();
	this->window->set_title(this->title);
	this->window->set_default_size(4 * (this->graph_size + 30), 2 * (this->graph_size + 70));
	this->window->add(*box);
	this->window->show_all_children();
}

Gtk::CheckButton* Frontend::create_check_button(const std::string& label, bool active, OptionSetter setter)
{
	Gtk::CheckButton* button = Gtk::manage(new Gtk::CheckButton(label));
	button->set_active(active);
	button->signal_toggled().connect(
		sigc::bind(sigc::mem_fun(*this, &Frontend::on_check_button_toggled), button, setter));
	return button;
}

void Frontend::on_scale_duration_changed()
{
	double step = GraphSettings::Duration_Step;
	unsigned int ms = (unsigned int) (std::round(this->scale_duration->get_value() / step) * step);

	if (! this->settings.set_duration(ms)) return;
	this->label_duration->set_text(std::to_string(this->settings.duration()) + " ms");
}

void Frontend::on_check_button_toggled(Gtk::CheckButton* button, OptionSetter setter)
{
	(this->settings.*setter)(button->get_active());
}

void Frontend::on_button_restart_clicked()
{
	this->board->restart_all();
}
