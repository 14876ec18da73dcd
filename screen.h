// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_SCREEN_H
#define SIMPLE_EASING_PLOT_SCREEN_H

#include <cairomm/context.h>
#include <cairomm/surface.h>

#include <simple-easing-plot/axis.h>

namespace SimpleEasingPlot
{

// owns a pair of same-sized buffers of one graph: the front buffer is the only one
// shown, the cache buffer keeps the last completed base pass.
class Screen
{
public:
	enum {Size_Min = 100, Size_Default = 300};

	Screen(unsigned int width = Size_Default, unsigned int height = Size_Default); //throws
	Screen(const Screen&) = delete;
	Screen& operator=(const Screen&) = delete;

	unsigned int width() const;
	unsigned int height() const;
	const Graph& graph() const;

	Cairo::RefPtr<Cairo::ImageSurface> front() const;
	Cairo::RefPtr<Cairo::ImageSurface> cache() const;
	Cairo::RefPtr<Cairo::Context> front_context() const; //new context for drawing on the front buffer

	void save_to_cache(); //front -> cache
	void draw_cache(); //cache -> front

private:
	unsigned int w, h;
	Graph gr;
	Cairo::RefPtr<Cairo::ImageSurface> buf_front, buf_cache;

	static Cairo::RefPtr<Cairo::ImageSurface> create_buffer(unsigned int width, unsigned int height);
	static void copy(const Cairo::RefPtr<Cairo::ImageSurface>& src, const Cairo::RefPtr<Cairo::ImageSurface>& dest);
};

inline unsigned int Screen::width() const
{
	return this->w;
}

inline unsigned int Screen::height() const
{
	return this->h;
}

inline const Graph& Screen::graph() const
{
	return this->gr;
}

inline Cairo::RefPtr<Cairo::ImageSurface> Screen::front() const
{
	return this->buf_front;
}

inline Cairo::RefPtr<Cairo::ImageSurface> Screen::cache() const
{
	return this->buf_cache;
}

inline Cairo::RefPtr<Cairo::Context> Screen::front_context() const
{
	return Cairo::Context::create(this->buf_front);
}

inline void Screen::save_to_cache()
{
	copy(this->buf_front, this->buf_cache);
}

inline void Screen::draw_cache()
{
	copy(this->buf_cache, this->buf_front);
}

}
#endif

