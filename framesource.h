// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_FRAME_SOURCE_H
#define SIMPLE_EASING_PLOT_FRAME_SOURCE_H

#include <glib.h> //gint64
#include <sigc++/sigc++.h>

#include <simple-easing-plot/curve.h>

namespace SimpleEasingPlot
{
class FrameClock; class FrameSource;

// the host's display refresh signal. times are monotonic, in microseconds.
class FrameClock
{
public:
	using SlotFrame = sigc::slot<bool, gint64>; //gets the frame time, returns false to stop

	virtual ~FrameClock() {}

	virtual gint64 now() const = 0;
	virtual unsigned int add_tick(const SlotFrame& slot) = 0; //returns a non-zero id
	virtual void remove_tick(unsigned int id) = 0;
};

// per-run sequence of frame points. start() emits the start point at once, then every
// frame tick emits the point at the elapsed time while x < 1; the end point (1, 1) is
// always emitted last, followed by signal_done(). each instance has its own timeline.
class FrameSource
{
public:
	FrameSource(FrameClock& clock, const CurveGenerator& gen);
	FrameSource(const FrameSource&) = delete;
	FrameSource& operator=(const FrameSource&) = delete;
	~FrameSource(); //cancels

	sigc::signal<void(const Coordinate&)> signal_point();
	sigc::signal<void()> signal_done();

	void start();
	void cancel(); //detaches from the clock synchronously, nothing will be emitted after it

	bool is_started() const;
	bool is_finished() const;
	bool is_cancelled() const;
	double elapsed() const; //of the last sample, in ms
	unsigned int count() const; //emitted points

private:
	FrameClock& clock;
	CurveGenerator gen;

	unsigned int tick_id = 0;
	gint64 t_start = 0;
	double elapsed_last = 0;
	unsigned int cnt = 0;
	bool flag_started = false, flag_finished = false, flag_cancelled = false;

	sigc::signal<void(const Coordinate&)> sig_point;
	sigc::signal<void()> sig_done;

	bool on_tick(gint64 frame_time);
	void emit_point(const Coordinate& point);
};

inline sigc::signal<void(const Coordinate&)> FrameSource::signal_point()
{
	return this->sig_point;
}

inline sigc::signal<void()> FrameSource::signal_done()
{
	return this->sig_done;
}

inline bool FrameSource::is_started() const
{
	return this->flag_started;
}

inline bool FrameSource::is_finished() const
{
	return this->flag_finished;
}

inline bool FrameSource::is_cancelled() const
{
	return this->flag_cancelled;
}

inline double FrameSource::elapsed() const
{
	return this->elapsed_last;
}

inline unsigned int FrameSource::count() const
{
	return this->cnt;
}

}
#endif

