// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/settings.h>

using namespace SimpleEasingPlot;

GraphSettings::GraphSettings() {}

AnimationOptions GraphSettings::animation_options(EasingFunc func) const
{
	return AnimationOptions(Value_From, Value_To, this->ms_duration, func);
}

bool GraphSettings::set_duration(unsigned int ms)
{
	if (ms < Duration_Min || ms > Duration_Max) return false;
	if (ms == this->ms_duration) return true;

	this->ms_duration = ms;
	this->sig_changed.emit();
	return true;
}

void GraphSettings::set_render_options(const RenderOptions& opt)
{
	if (opt == this->opt_render) return;
	this->opt_render = opt;
	this->sig_changed.emit();
}

void GraphSettings::set_option_render_points(bool set)
{
	this->set_option(&RenderOptions::render_points, set);
}

void GraphSettings::set_option_render_coords(bool set)
{
	this->set_option(&RenderOptions::render_coords, set);
}

void GraphSettings::set_option_render_optimal(bool set)
{
	this->set_option(&RenderOptions::render_optimal, set);
}

void GraphSettings::set_option_render_effective(bool set)
{
	this->set_option(&RenderOptions::render_effective, set);
}

void GraphSettings::set_option_render_framelines(bool set)
{
	this->set_option(&RenderOptions::render_framelines, set);
}

/*------------------------------ private functions ------------------------------*/

void GraphSettings::set_option(bool RenderOptions::* option, bool set)
{
	if (this->opt_render.*option == set) return;
	this->opt_render.*option = set;
	this->sig_changed.emit();
}
