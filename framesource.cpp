// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/framesource.h>

#include <stdexcept>

using namespace SimpleEasingPlot;

FrameSource::FrameSource(FrameClock& clock, const CurveGenerator& gen):
	clock(clock), gen(gen)
{}

FrameSource::~FrameSource()
{
	this->cancel();
}

void FrameSource::start()
{
	if (this->flag_cancelled)
		throw std::runtime_error("FrameSource::start(): the source is cancelled.");
	if (this->flag_started) return;
	this->flag_started = true;

	this->t_start = this->clock.now();
	this->tick_id = this->clock.add_tick(sigc::mem_fun(*this, &FrameSource::on_tick));
	if (this->tick_id == 0)
		throw std::runtime_error("FrameSource::start(): the frame clock refused the tick callback.");

	this->emit_point(this->gen.start_point());
}

void FrameSource::cancel()
{
	if (this->flag_finished || this->flag_cancelled) return;
	this->flag_cancelled = true;

	if (this->tick_id) {
		this->clock.remove_tick(this->tick_id);
		this->tick_id = 0;
	}
}

/*------------------------------ private functions ------------------------------*/

bool FrameSource::on_tick(gint64 frame_time)
{
	if (this->flag_cancelled || this->flag_finished) return false;

	// frame time of the current frame may be earlier than the start of this run
	double elapsed = (frame_time - this->t_start) / 1000.0;
	if (elapsed < this->elapsed_last) elapsed = this->elapsed_last;
	this->elapsed_last = elapsed;

	Coordinate pt = this->gen.point(elapsed);
	if (pt.x < 1) {
		this->emit_point(pt);
		return !this->flag_cancelled; //a slot may have cancelled this source
	}

	this->flag_finished = true;
	this->tick_id = 0; //removed by returning false
	this->emit_point(CurveGenerator::end_point());
	this->sig_done.emit();
	return false;
}

void FrameSource::emit_point(const Coordinate& point)
{
	this->cnt++;
	this->sig_point.emit(point);
}
