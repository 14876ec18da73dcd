// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_AXIS_H
#define SIMPLE_EASING_PLOT_AXIS_H

#include <cmath>
#include <stdexcept>
#include <vector>

namespace SimpleEasingPlot
{
struct Coordinate; struct Line; class OptionalCoordinate;
struct Axis; struct Graph;

using CoordinateList = std::vector<Coordinate>;
using LineList = std::vector<Line>;

// x is the time fraction, y is the value fraction. y may leave [0, 1] for overshooting easings.
struct Coordinate
{
	double x = 0, y = 0;

	Coordinate();
	Coordinate(double x, double y);

	bool operator==(const Coordinate& coord) const;
	bool operator!=(const Coordinate& coord) const;
	double distance(const Coordinate& coord) const; //euclidean
};

struct Line
{
	Coordinate from, to;

	Line();
	Line(const Coordinate& from, const Coordinate& to);

	bool operator==(const Line& line) const;
};

// a coordinate or null; two nulls are equal
class OptionalCoordinate
{
public:
	OptionalCoordinate();
	OptionalCoordinate(const Coordinate& coord);

	operator bool() const;
	const Coordinate& get() const; //throws std::logic_error if it's null

	bool operator==(const OptionalCoordinate& opt) const;
	bool operator!=(const OptionalCoordinate& opt) const;

private:
	bool valid;
	Coordinate coord;
};

// screen-space parameters of one dimension. min and max are pixel positions of 0 and 1
struct Axis
{
	double min = 0, max = 0;
	double edge = 0; //where the drawn axis line ends
	double offset = 0; //margin between the surface border and min
	double delta = 0; //max - min, negative for the y axis

	Axis();
	Axis(double min, double max, double edge, double offset);

	double normalize(double pixel) const;
	double absolute(double val) const;
};

// paired axes of a graph, derived once from the surface size
struct Graph
{
	Axis x, y;

	Graph();
	Graph(unsigned int width, unsigned int height);

	Coordinate normalize(double pixel_x, double pixel_y) const;
	Coordinate normalize(const Coordinate& pixel) const;
	Coordinate absolute(const Coordinate& coord) const;
};

/*------------------------------ Coordinate, Line functions ------------------------------*/

inline Coordinate::Coordinate() {}

inline Coordinate::Coordinate(double x, double y): x(x), y(y) {}

inline bool Coordinate::operator==(const Coordinate& coord) const
{
	return this->x == coord.x && this->y == coord.y;
}

inline bool Coordinate::operator!=(const Coordinate& coord) const
{
	return !(*this == coord);
}

inline double Coordinate::distance(const Coordinate& coord) const
{
	double dx = this->x - coord.x, dy = this->y - coord.y;
	return std::sqrt(dx*dx + dy*dy);
}

inline Line::Line() {}

inline Line::Line(const Coordinate& from, const Coordinate& to): from(from), to(to) {}

inline bool Line::operator==(const Line& line) const
{
	return this->from == line.from && this->to == line.to;
}

/*------------------------------ OptionalCoordinate functions ------------------------------*/

inline OptionalCoordinate::OptionalCoordinate(): valid(false) {}

inline OptionalCoordinate::OptionalCoordinate(const Coordinate& coord): valid(true), coord(coord) {}

inline OptionalCoordinate::operator bool() const
{
	return this->valid;
}

inline const Coordinate& OptionalCoordinate::get() const
{
	if (! this->valid)
		throw std::logic_error("OptionalCoordinate::get(): the coordinate is null.");
	return this->coord;
}

inline bool OptionalCoordinate::operator==(const OptionalCoordinate& opt) const
{
	if (!this->valid || !opt.valid) return this->valid == opt.valid;
	return this->coord == opt.coord;
}

inline bool OptionalCoordinate::operator!=(const OptionalCoordinate& opt) const
{
	return !(*this == opt);
}

/*------------------------------ Axis functions ------------------------------*/

inline Axis::Axis() {}

inline Axis::Axis(double min, double max, double edge, double offset):
	min(min), max(max), edge(edge), offset(offset), delta(max - min)
{
	if (this->delta == 0)
		throw std::invalid_argument("Axis::Axis(): min and max are equal.");
}

inline double Axis::normalize(double pixel) const
{
	return (pixel - this->min) / this->delta;
}

inline double Axis::absolute(double val) const
{
	return this->min + val * this->delta;
}

/*------------------------------ Graph functions ------------------------------*/

inline Graph::Graph() {}

inline Graph::Graph(unsigned int width, unsigned int height)
{
	double offset_x_left = 0.05 * width, offset_x_right = 0.02 * width;
	double offset_y_top = 0.05 * height, offset_y_bottom = 0.08 * height;

	double edge_x = width - offset_x_right;
	this->x = Axis(offset_x_left, edge_x - 20, edge_x, offset_x_left);

	double edge_y = offset_y_top; //y grows upwards on the screen
	this->y = Axis(height - offset_y_bottom, edge_y + offset_y_top + 8, edge_y, offset_y_bottom);
}

inline Coordinate Graph::normalize(double pixel_x, double pixel_y) const
{
	return Coordinate(this->x.normalize(pixel_x), this->y.normalize(pixel_y));
}

inline Coordinate Graph::normalize(const Coordinate& pixel) const
{
	return this->normalize(pixel.x, pixel.y);
}

inline Coordinate Graph::absolute(const Coordinate& coord) const
{
	return Coordinate(this->x.absolute(coord.x), this->y.absolute(coord.y));
}

}
#endif

