// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_SETTINGS_H
#define SIMPLE_EASING_PLOT_SETTINGS_H

#include <sigc++/sigc++.h>

#include <simple-easing-plot/curve.h>

namespace SimpleEasingPlot
{
struct RenderOptions; class GraphSettings;

// applied at the start of the next run
struct RenderOptions
{
	bool render_points = false; //markers at each frame point
	bool render_coords = true; //highlight and readout of the point nearest to the pointer
	bool render_optimal = true; //the reference curve sampled every millisecond
	bool render_effective = true; //the curve made of frame points
	bool render_framelines = false; //a vertical line at each frame point

	bool operator==(const RenderOptions& opt) const;
	bool operator!=(const RenderOptions& opt) const;
};

// the inputs shared by all graph instances: duration and render options.
// setters reject invalid values by returning false; a real change emits signal_changed().
class GraphSettings
{
public:
	enum {Duration_Min = 100, Duration_Max = 5000, Duration_Default = 1000, Duration_Step = 100};
	enum {Value_From = 0, Value_To = 100};

	GraphSettings();
	GraphSettings(const GraphSettings&) = delete;
	GraphSettings& operator=(const GraphSettings&) = delete;

	unsigned int duration() const; //ms
	const RenderOptions& render_options() const;
	AnimationOptions animation_options(EasingFunc func) const;

	bool set_duration(unsigned int ms);
	void set_render_options(const RenderOptions& opt);
	void set_option_render_points(bool set); //default: false
	void set_option_render_coords(bool set); //default: true
	void set_option_render_optimal(bool set); //default: true
	void set_option_render_effective(bool set); //default: true
	void set_option_render_framelines(bool set); //default: false

	sigc::signal<void()> signal_changed() const;

private:
	unsigned int ms_duration = Duration_Default;
	RenderOptions opt_render;
	sigc::signal<void()> sig_changed;

	void set_option(bool RenderOptions::* option, bool set);
};

inline bool RenderOptions::operator==(const RenderOptions& opt) const
{
	return this->render_points     == opt.render_points
	    && this->render_coords     == opt.render_coords
	    && this->render_optimal    == opt.render_optimal
	    && this->render_effective  == opt.render_effective
	    && this->render_framelines == opt.render_framelines;
}

inline bool RenderOptions::operator!=(const RenderOptions& opt) const
{
	return !(*this == opt);
}

inline unsigned int GraphSettings::duration() const
{
	return this->ms_duration;
}

inline const RenderOptions& GraphSettings::render_options() const
{
	return this->opt_render;
}

inline sigc::signal<void()> GraphSettings::signal_changed() const
{
	return this->sig_changed;
}

}
#endif

