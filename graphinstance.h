// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_GRAPH_INSTANCE_H
#define SIMPLE_EASING_PLOT_GRAPH_INSTANCE_H

#include <string>
#include <vector>

#include <sigc++/sigc++.h>

#include <simple-easing-plot/framesource.h>
#include <simple-easing-plot/pointertracker.h>
#include <simple-easing-plot/nearestpoint.h>
#include <simple-easing-plot/linebuilder.h>
#include <simple-easing-plot/renderer.h>
#include <simple-easing-plot/settings.h>

namespace SimpleEasingPlot
{
class GraphHost; class GraphRun; class GraphInstance;

// the surface a graph lives on: it provides the frame clock and the pointer events,
// and shows the front buffer of the graph's screen when present() is called.
class GraphHost: public FrameClock, public PointerSource
{
public:
	virtual void present() = 0;
};

enum RunState
{
	Run_Idle,
	Run_Running,
	Run_Cancelled,
	Run_Completed
};

// one run of a graph: the frame source, the accumulated lists, the pointer tracker and
// the nearest point resolver, wired to the renderer. every callback checks the run's
// generation against the owner's current one, so a superseded run never draws.
class GraphRun: public sigc::trackable
{
public:
	GraphRun(GraphHost& host, Renderer& renderer, const AnimationOptions& anim, const RenderOptions& opt,
	         unsigned long int generation, const unsigned long int& generation_current); //throws
	GraphRun(const GraphRun&) = delete;
	GraphRun& operator=(const GraphRun&) = delete;
	~GraphRun(); //cancels

	void start();
	void cancel(); //detaches from the frame clock and the pointer source synchronously

	RunState state() const;
	bool is_current() const; //not cancelled and not superseded
	unsigned long int generation() const;

	const AnimationOptions& animation_options() const;
	const RenderOptions& render_options() const;
	const GraphRunState& accumulated() const;
	const PointerTracker& pointer_tracker() const;
	const OptionalCoordinate& highlight() const; //null if nothing is highlighted

	sigc::signal<void()> signal_completed();

private:
	GraphHost& host;
	Renderer& renderer;
	const AnimationOptions anim;
	const RenderOptions opt;
	const unsigned long int gen;
	const unsigned long int& gen_current;
	RunState st = Run_Idle;

	CurveGenerator curve;
	GraphRunState acc;
	LineBuilder builder;
	FrameSource frames;
	PointerTracker tracker;
	NearestPointResolver resolver;

	std::vector<sigc::connection> conns;
	sigc::signal<void()> sig_completed;

	void on_lines(const LineList& lines);
	void on_highlight(const OptionalCoordinate& coord);
	void on_frames_done();
	void draw_base(const LineList& lines);
};

// a graph bound to one easing function. it owns the runs: start() mounts the graph and
// makes it follow the shared settings, restart() supersedes the current run with a new
// one, dispose() cancels everything. it never touches another instance's screen.
class GraphInstance
{
public:
	GraphInstance(GraphHost& host, Screen& screen, const std::string& name, EasingFunc func,
	              const GraphSettings& settings); //throws std::invalid_argument if func is null
	GraphInstance(const GraphInstance&) = delete;
	GraphInstance& operator=(const GraphInstance&) = delete;
	virtual ~GraphInstance(); //disposes

	const std::string& name() const;
	EasingFunc easing() const;
	const Screen& screen() const;
	const Renderer& renderer() const;

	void start(); //does nothing if it's started already
	void restart();
	void dispose();

	bool is_started() const;
	bool is_disposed() const;
	RunState state() const; //Run_Idle before the first run
	unsigned long int generation() const; //of the current run, 0 before the first run
	const GraphRun* run() const; //NULL before the first run
	unsigned long int count_cancelled() const;

private:
	GraphHost& host;
	Screen& scr;
	std::string str_name;
	EasingFunc func;
	const GraphSettings& settings;

	Renderer rend;
	GraphRun* cur_run = NULL;
	unsigned long int gen_current = 0, cnt_cancelled = 0;

	sigc::connection conn_settings;
	bool flag_started = false, flag_disposed = false;

	void cancel_run();
	void on_run_completed();
};

inline RunState GraphRun::state() const
{
	return this->st;
}

inline bool GraphRun::is_current() const
{
	return this->gen == this->gen_current && this->st != Run_Cancelled;
}

inline unsigned long int GraphRun::generation() const
{
	return this->gen;
}

inline const AnimationOptions& GraphRun::animation_options() const
{
	return this->anim;
}

inline const RenderOptions& GraphRun::render_options() const
{
	return this->opt;
}

inline const GraphRunState& GraphRun::accumulated() const
{
	return this->acc;
}

inline const PointerTracker& GraphRun::pointer_tracker() const
{
	return this->tracker;
}

inline sigc::signal<void()> GraphRun::signal_completed()
{
	return this->sig_completed;
}

inline const std::string& GraphInstance::name() const
{
	return this->str_name;
}

inline EasingFunc GraphInstance::easing() const
{
	return this->func;
}

inline const Screen& GraphInstance::screen() const
{
	return this->scr;
}

inline const Renderer& GraphInstance::renderer() const
{
	return this->rend;
}

inline bool GraphInstance::is_started() const
{
	return this->flag_started;
}

inline bool GraphInstance::is_disposed() const
{
	return this->flag_disposed;
}

inline RunState GraphInstance::state() const
{
	if (! this->cur_run) return Run_Idle;
	return this->cur_run->state();
}

inline unsigned long int GraphInstance::generation() const
{
	return this->gen_current;
}

inline const GraphRun* GraphInstance::run() const
{
	return this->cur_run;
}

inline unsigned long int GraphInstance::count_cancelled() const
{
	return this->cnt_cancelled;
}

}
#endif

