#include <iostream>
#include <vector>

#include <glibmm/init.h>
#include <glibmm/optioncontext.h>
#include <glibmm/optiongroup.h>
#include <glibmm/optionentry.h>

#include <simple-easing-plot/frontend.h>

using namespace std;

using namespace SimpleEasingPlot;

class Demo
{
	GraphSettings settings;
	std::vector<EasingEntry> entries;
	unsigned int graph_size = Screen::Size_Default;

	// command line options
	int opt_duration = GraphSettings::Duration_Default, opt_size = Screen::Size_Default;
	bool opt_points = false, opt_no_coords = false, opt_no_optimal = false,
	     opt_no_effective = false, opt_framelines = false, opt_verbose = false;
	std::vector<Glib::ustring> opt_easings;

	void add_entry(Glib::OptionGroup& group, const Glib::ustring& name, const Glib::ustring& descr, bool& arg);
	void apply_options();

public:
	bool parse(int& argc, char**& argv);
	int run();
};

bool Demo::parse(int& argc, char**& argv)
{
	Glib::OptionContext context("- plots easing functions");
	Glib::OptionGroup group("graph", "Graph options", "Show graph options");

	Glib::OptionEntry entry_duration;
	entry_duration.set_long_name("duration"); entry_duration.set_arg_description("MS");
	entry_duration.set_description("Duration of the animation, 100 to 5000 ms");
	group.add_entry(entry_duration, this->opt_duration);

	Glib::OptionEntry entry_size;
	entry_size.set_long_name("size"); entry_size.set_arg_description("PX");
	entry_size.set_description("Width and height of each graph, at least 100 px");
	group.add_entry(entry_size, this->opt_size);

	Glib::OptionEntry entry_easing;
	entry_easing.set_long_name("easing"); entry_easing.set_arg_description("NAME");
	entry_easing.set_description("Show this easing function only, can be repeated");
	group.add_entry(entry_easing, this->opt_easings);

	this->add_entry(group, "points", "Show frame points", this->opt_points);
	this->add_entry(group, "no-coords", "Don't show the coordinate of the nearest point", this->opt_no_coords);
	this->add_entry(group, "no-optimal", "Don't show the optimal curve", this->opt_no_optimal);
	this->add_entry(group, "no-effective", "Don't show the effective curve", this->opt_no_effective);
	this->add_entry(group, "framelines", "Show frame lines", this->opt_framelines);
	this->add_entry(group, "verbose", "Print debug messages", this->opt_verbose);

	context.set_main_group(group);
	try {
		context.parse(argc, argv);
	} catch (const Glib::Error& ex) {
		cerr << ex.what() << endl;
		return false;
	}

	this->apply_options();
	return true;
}

int Demo::run()
{
	Frontend frontend(this->settings, this->entries, this->graph_size);
	return frontend.run(); //blocks
}

void Demo::add_entry(Glib::OptionGroup& group, const Glib::ustring& name, const Glib::ustring& descr, bool& arg)
{
	Glib::OptionEntry entry;
	entry.set_long_name(name); entry.set_description(descr);
	group.add_entry(entry, arg);
}

void Demo::apply_options()
{
	if (this->opt_verbose)
		g_setenv("G_MESSAGES_DEBUG", G_LOG_DOMAIN, TRUE);

	if (this->opt_duration < 0 || !this->settings.set_duration(this->opt_duration))
		g_warning("invalid duration %d ms, %u ms is used.", this->opt_duration, this->settings.duration());

	if (this->opt_size >= Screen::Size_Min)
		this->graph_size = this->opt_size;
	else
		g_warning("invalid graph size %d px, %u px is used.", this->opt_size, this->graph_size);

	this->settings.set_option_render_points(this->opt_points);
	this->settings.set_option_render_coords(! this->opt_no_coords);
	this->settings.set_option_render_optimal(! this->opt_no_optimal);
	this->settings.set_option_render_effective(! this->opt_no_effective);
	this->settings.set_option_render_framelines(this->opt_framelines);

	for (const Glib::ustring& name : this->opt_easings) {
		EasingFunc func = find_easing(name.raw());
		if (func) {
			EasingEntry entry = {name.raw(), func};
			this->entries.push_back(entry);
		} else
			g_warning("unknown easing function %s is ignored.", name.c_str());
	}
	if (this->entries.empty())
		this->entries = easing_catalogue();
}

int main(int argc, char** argv)
{
	Glib::init();

	Demo demo;
	if (! demo.parse(argc, argv)) return 1;
	return demo.run();
}

