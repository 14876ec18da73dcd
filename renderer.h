// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_RENDERER_H
#define SIMPLE_EASING_PLOT_RENDERER_H

#include <vector>

#include <simple-easing-plot/screen.h>
#include <simple-easing-plot/curve.h>
#include <simple-easing-plot/settings.h>

namespace SimpleEasingPlot
{

struct Color
{
	double red, green, blue;
};

// two passes on a Screen. the base pass redraws everything into the front buffer and
// commits it to the cache only when it has completed; the highlight pass restores the
// cache and draws the hints and the readout on top of it.
class Renderer
{
public:
	static const Color Color_Back, Color_Axis, Color_Frameline, Color_Optimal,
	                   Color_Effective, Color_Point, Color_Hint;

	Renderer(Screen& screen);

	const Graph& graph() const;

	// returns false if drawing failed; the previous complete frame is restored then
	bool draw_base(const LineList& lines, const LineList& optimal, const RenderOptions& opt);
	void draw_highlight(const OptionalCoordinate& highlight, const CurveGenerator& gen);

	unsigned long int count_base_passes() const; //completed ones
	unsigned long int count_highlight_passes() const;

	// hint lines from both axes to the coordinate, reflected across the x axis if y < 0
	static LineList hint_lines(const Coordinate& coord);

private:
	Screen& screen;
	unsigned long int cnt_base = 0, cnt_highlight = 0;
	const std::vector<double> dash_pattern = {5, 5}; //used for drawing hint lines

	void draw_axis(const Cairo::RefPtr<Cairo::Context>& cr);
	void draw_framelines(const Cairo::RefPtr<Cairo::Context>& cr, const LineList& lines);
	void draw_lines(const Cairo::RefPtr<Cairo::Context>& cr, const LineList& lines,
	                const Color& color, bool dashed = false);
	void draw_points(const Cairo::RefPtr<Cairo::Context>& cr, const LineList& lines);
	void draw_readout(const Cairo::RefPtr<Cairo::Context>& cr, const std::string& str);
};

inline const Graph& Renderer::graph() const
{
	return this->screen.graph();
}

inline unsigned long int Renderer::count_base_passes() const
{
	return this->cnt_base;
}

inline unsigned long int Renderer::count_highlight_passes() const
{
	return this->cnt_highlight;
}

}
#endif

