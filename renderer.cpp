// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/renderer.h>

#include <exception>

#include <glib.h> //G_PI

using namespace SimpleEasingPlot;

const Color Renderer::Color_Back      = {1.0, 1.0, 1.0}; //white
const Color Renderer::Color_Axis      = {0.0, 0.0, 0.0}; //black
const Color Renderer::Color_Frameline = {0xea / 255.0, 0xea / 255.0, 0xea / 255.0};
const Color Renderer::Color_Optimal   = {0.0, 0.0, 1.0}; //blue
const Color Renderer::Color_Effective = {0x5f / 255.0, 0x02 / 255.0, 0x1f / 255.0}; //deep red
const Color Renderer::Color_Point     = {0.0, 0.0, 0.0};
const Color Renderer::Color_Hint      = {0xbd / 255.0, 0xbd / 255.0, 0xbd / 255.0}; //light gray

static inline void set_cr_color(const Cairo::RefPtr<Cairo::Context>& cr, const Color& color)
{
	cr->set_source_rgb(color.red, color.green, color.blue);
}

static inline void set_cr_font(const Cairo::RefPtr<Cairo::Context>& cr)
{
	cr->select_font_face("serif", Cairo::FONT_SLANT_NORMAL, Cairo::FONT_WEIGHT_NORMAL);
	cr->set_font_size(10);
}

Renderer::Renderer(Screen& screen): screen(screen) {}

bool Renderer::draw_base(const LineList& lines, const LineList& optimal, const RenderOptions& opt)
{
	try {
		Cairo::RefPtr<Cairo::Context> cr = this->screen.front_context();
		cr->set_line_width(1.0);

		this->draw_axis(cr);
		if (opt.render_framelines) this->draw_framelines(cr, lines);
		if (opt.render_optimal)    this->draw_lines(cr, optimal, Color_Optimal);
		if (opt.render_effective)  this->draw_lines(cr, lines, Color_Effective);
		if (opt.render_points)     this->draw_points(cr, lines);
	} catch (const std::exception& ex) {
		g_warning("Renderer::draw_base(): %s; the previous frame is kept.", ex.what());
		this->screen.draw_cache();
		return false;
	}

	this->screen.front()->flush();
	this->screen.save_to_cache();
	this->cnt_base++;
	return true;
}

void Renderer::draw_highlight(const OptionalCoordinate& highlight, const CurveGenerator& gen)
{
	this->screen.draw_cache();
	this->cnt_highlight++;
	if (! highlight) return;

	Cairo::RefPtr<Cairo::Context> cr = this->screen.front_context();
	cr->set_line_width(1.0);
	this->draw_lines(cr, hint_lines(highlight.get()), Color_Hint, true);
	this->draw_readout(cr, gen.readout(highlight.get()));
	this->screen.front()->flush();
}

LineList Renderer::hint_lines(const Coordinate& coord)
{
	LineList lines;
	if (coord.y < 0) {
		Coordinate mirror(coord.x, -coord.y);
		lines.push_back(Line(Coordinate(0, -coord.y), mirror));
		lines.push_back(Line(mirror, coord));
	} else {
		lines.push_back(Line(Coordinate(0, coord.y), coord));
		lines.push_back(Line(Coordinate(coord.x, 0), coord));
	}
	return lines;
}

/*------------------------------ private functions ------------------------------*/

void Renderer::draw_axis(const Cairo::RefPtr<Cairo::Context>& cr)
{
	const Graph& graph = this->screen.graph();
	const Axis& ax = graph.x, & ay = graph.y;

	set_cr_color(cr, Color_Back);
	cr->rectangle(0, 0, this->screen.width(), this->screen.height());
	cr->fill();

	LineList axis_lines;
	axis_lines.push_back(Line(graph.normalize(ax.min, ay.min), graph.normalize(ax.edge, ay.min)));
	axis_lines.push_back(Line(graph.normalize(ax.min, ay.edge), graph.normalize(ax.min, ay.min)));
	this->draw_lines(cr, axis_lines, Color_Axis);

	set_cr_color(cr, Color_Axis); set_cr_font(cr);
	cr->move_to(ax.min, ay.min + 10);      cr->show_text("0");
	cr->move_to(ax.max, ay.min + 10);      cr->show_text("1");
	cr->move_to(ax.edge - 5, ay.min + 8);  cr->show_text("t");
	cr->move_to(ax.min - 8, ay.edge + 5);  cr->show_text("v");
	cr->move_to(ax.min - 8, ay.max);       cr->show_text("1");
	cr->begin_new_path();
}

void Renderer::draw_framelines(const Cairo::RefPtr<Cairo::Context>& cr, const LineList& lines)
{
	LineList framelines; framelines.reserve(lines.size());
	for (const Line& line : lines)
		framelines.push_back(Line(Coordinate(line.to.x, 1), Coordinate(line.to.x, 0)));
	this->draw_lines(cr, framelines, Color_Frameline);
}

void Renderer::draw_lines(const Cairo::RefPtr<Cairo::Context>& cr, const LineList& lines,
                          const Color& color, bool dashed)
{
	const Graph& graph = this->screen.graph();

	cr->begin_new_path();
	set_cr_color(cr, color);
	if (dashed)
		cr->set_dash(this->dash_pattern, 0);
	else
		cr->unset_dash();

	Coordinate from, to;
	for (const Line& line : lines) {
		from = graph.absolute(line.from); to = graph.absolute(line.to);
		cr->move_to(from.x, from.y);
		cr->line_to(to.x, to.y);
	}
	cr->stroke();
	cr->unset_dash();
}

void Renderer::draw_points(const Cairo::RefPtr<Cairo::Context>& cr, const LineList& lines)
{
	const Graph& graph = this->screen.graph();
	set_cr_color(cr, Color_Point);
	cr->unset_dash();

	Coordinate pt;
	for (const Line& line : lines) {
		pt = graph.absolute(line.to);
		cr->begin_new_path();
		cr->arc(pt.x, pt.y, 1, 0, 2 * G_PI);
		cr->stroke_preserve();
		cr->fill();
	}
}

void Renderer::draw_readout(const Cairo::RefPtr<Cairo::Context>& cr, const std::string& str)
{
	set_cr_color(cr, Color_Hint); set_cr_font(cr);

	Cairo::TextExtents extents;
	cr->get_text_extents(str, extents);
	cr->move_to(this->screen.width() - 10 - extents.x_advance, 20);
	cr->show_text(str);
	cr->begin_new_path();
}
