// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/graphinstance.h>

#include <stdexcept>

#include <glib.h>

using namespace SimpleEasingPlot;

static const OptionalCoordinate Null_Coordinate;

/*------------------------------ GraphRun functions ------------------------------*/

GraphRun::GraphRun(GraphHost& host, Renderer& renderer, const AnimationOptions& anim, const RenderOptions& opt,
                   unsigned long int generation, const unsigned long int& generation_current):
	host(host), renderer(renderer), anim(anim), opt(opt),
	gen(generation), gen_current(generation_current),
	curve(anim), builder(acc), frames(host, curve),
	tracker(host, renderer.graph()), resolver(acc.points(), tracker.coordinate())
{}

GraphRun::~GraphRun()
{
	this->cancel();
}

void GraphRun::start()
{
	if (this->st != Run_Idle) return;
	this->st = Run_Running;

	// computed once, handed out to the base passes of the whole run
	this->acc.optimal().emit(optimal_reference(this->curve));

	// clears the previous run's curve before the first point of this run
	this->draw_base(LineList());

	this->conns.push_back(this->acc.lines().connect(
		sigc::mem_fun(*this, &GraphRun::on_lines), false));

	if (this->opt.render_coords) {
		this->conns.push_back(this->resolver.highlight().connect(
			sigc::mem_fun(*this, &GraphRun::on_highlight), false));
		this->tracker.start();
		this->resolver.start();
	}

	this->conns.push_back(this->frames.signal_point().connect(
		sigc::mem_fun(this->builder, &LineBuilder::push)));
	this->conns.push_back(this->frames.signal_done().connect(
		sigc::mem_fun(*this, &GraphRun::on_frames_done)));
	this->frames.start();
}

void GraphRun::cancel()
{
	if (this->st == Run_Cancelled) return;
	this->st = Run_Cancelled;

	this->frames.cancel();
	this->tracker.cancel();
	this->resolver.cancel();

	for (sigc::connection& conn : this->conns)
		conn.disconnect();
	this->conns.clear();
}

const OptionalCoordinate& GraphRun::highlight() const
{
	if (! this->resolver.highlight().has_value()) return Null_Coordinate;
	return this->resolver.highlight().value();
}

/*------------------------------ private functions ------------------------------*/

void GraphRun::on_lines(const LineList& lines)
{
	if (! this->is_current()) return;
	this->draw_base(lines);
}

void GraphRun::on_highlight(const OptionalCoordinate& coord)
{
	if (!this->is_current() || !this->opt.render_coords) return;
	this->renderer.draw_highlight(coord, this->curve);
	this->host.present();
}

void GraphRun::on_frames_done()
{
	if (! this->is_current()) return;
	this->st = Run_Completed;
	this->sig_completed.emit();
}

void GraphRun::draw_base(const LineList& lines)
{
	this->renderer.draw_base(lines, this->acc.optimal_list(), this->opt);

	// the base pass overwrote the hints, put the latest highlight on top again
	if (this->opt.render_coords)
		this->renderer.draw_highlight(this->highlight(), this->curve);
	this->host.present();
}

/*------------------------------ GraphInstance functions ------------------------------*/

GraphInstance::GraphInstance(GraphHost& host, Screen& screen, const std::string& name, EasingFunc func,
                             const GraphSettings& settings):
	host(host), scr(screen), str_name(name), func(func), settings(settings), rend(screen)
{
	if (! func)
		throw std::invalid_argument("GraphInstance::GraphInstance(): the easing function of "
		                            + name + " is null.");
}

GraphInstance::~GraphInstance()
{
	this->dispose();
}

void GraphInstance::start()
{
	if (this->flag_disposed)
		throw std::runtime_error("GraphInstance::start(): the instance is disposed.");
	if (this->flag_started) return;
	this->flag_started = true;

	this->conn_settings = this->settings.signal_changed().connect(
		sigc::mem_fun(*this, &GraphInstance::restart));
	this->restart();
}

void GraphInstance::restart()
{
	if (this->flag_disposed) return;
	if (! this->flag_started) {
		this->start(); return;
	}

	this->cancel_run();
	this->gen_current++;

	this->cur_run = new GraphRun(this->host, this->rend,
	                             this->settings.animation_options(this->func), this->settings.render_options(),
	                             this->gen_current, this->gen_current);
	this->cur_run->signal_completed().connect(sigc::mem_fun(*this, &GraphInstance::on_run_completed));

	g_debug("%s: run %lu started, duration %u ms.",
	        this->str_name.c_str(), this->gen_current, this->settings.duration());
	this->cur_run->start();
}

void GraphInstance::dispose()
{
	if (this->flag_disposed) return;
	this->flag_disposed = true;

	this->conn_settings.disconnect();
	this->cancel_run();
}

/*------------------------------ private functions ------------------------------*/

void GraphInstance::cancel_run()
{
	if (! this->cur_run) return;

	if (this->cur_run->state() == Run_Running) {
		this->cnt_cancelled++;
		g_debug("%s: run %lu cancelled.", this->str_name.c_str(), this->cur_run->generation());
	}
	this->cur_run->cancel();
	delete this->cur_run; this->cur_run = NULL;
}

void GraphInstance::on_run_completed()
{
	g_debug("%s: run %lu completed with %u frame points.", this->str_name.c_str(),
	        this->cur_run->generation(), this->cur_run->accumulated().point_count());
}
