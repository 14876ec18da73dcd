// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_TEST_HOST_H
#define SIMPLE_EASING_PLOT_TEST_HOST_H

#include <cmath> //llround()
#include <map>
#include <vector>

#include <simple-easing-plot/graphinstance.h>

namespace SimpleEasingPlot
{

// a GraphHost driven by hand: the clock moves only by advance(), each advance is one
// frame, and pointer events are fed directly.
class TestHost: public GraphHost
{
public:
	gint64 now() const override;
	unsigned int add_tick(const SlotFrame& slot) override;
	void remove_tick(unsigned int id) override;
	bool is_pointer_inside() const override;
	void present() override;

	void advance(double ms); //moves the clock, then fires one frame
	void run_until_idle(double ms_step, unsigned int frames_max = 100000);

	void enter();
	void move(double pixel_x, double pixel_y);
	void leave();

	unsigned int count_ticks() const; //registered tick callbacks
	unsigned long int count_presented() const;

private:
	gint64 t_now = 1000000;
	unsigned int id_last = 0;
	std::map<unsigned int, SlotFrame> ticks;
	bool flag_inside = false;
	unsigned long int cnt_presented = 0;
};

inline gint64 TestHost::now() const
{
	return this->t_now;
}

inline unsigned int TestHost::add_tick(const SlotFrame& slot)
{
	this->ticks[++this->id_last] = slot;
	return this->id_last;
}

inline void TestHost::remove_tick(unsigned int id)
{
	this->ticks.erase(id);
}

inline bool TestHost::is_pointer_inside() const
{
	return this->flag_inside;
}

inline void TestHost::present()
{
	this->cnt_presented++;
}

inline void TestHost::advance(double ms)
{
	this->t_now += (gint64) std::llround(ms * 1000);

	// a callback may add or remove ticks
	std::vector<unsigned int> ids;
	for (const auto& tick : this->ticks)
		ids.push_back(tick.first);

	for (unsigned int id : ids) {
		auto it = this->ticks.find(id);
		if (it == this->ticks.end()) continue;
		SlotFrame slot = it->second;
		if (! slot(this->t_now)) this->ticks.erase(id);
	}
}

inline void TestHost::run_until_idle(double ms_step, unsigned int frames_max)
{
	for (unsigned int i = 0; i < frames_max && !this->ticks.empty(); i++)
		this->advance(ms_step);
}

inline void TestHost::enter()
{
	this->flag_inside = true;
	this->sig_enter.emit();
}

inline void TestHost::move(double pixel_x, double pixel_y)
{
	this->sig_move.emit(pixel_x, pixel_y);
}

inline void TestHost::leave()
{
	this->flag_inside = false;
	this->sig_leave.emit();
}

inline unsigned int TestHost::count_ticks() const
{
	return this->ticks.size();
}

inline unsigned long int TestHost::count_presented() const
{
	return this->cnt_presented;
}

}
#endif

