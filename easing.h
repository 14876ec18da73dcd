// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_EASING_H
#define SIMPLE_EASING_PLOT_EASING_H

#include <string>
#include <vector>

namespace SimpleEasingPlot
{

// (elapsed, start value, value delta, duration) -> value at elapsed. must be pure.
using EasingFunc = double (*)(double elapsed, double start, double delta, double duration);

struct EasingEntry
{
	std::string name;
	EasingFunc func;
};

const std::vector<EasingEntry>& easing_catalogue(); //in display order
EasingFunc find_easing(const std::string& name); //NULL if the name is unknown

namespace Easing
{
	double in_quad(double t, double b, double c, double d);
	double out_quad(double t, double b, double c, double d);
	double in_out_quad(double t, double b, double c, double d);
	double in_cubic(double t, double b, double c, double d);
	double out_cubic(double t, double b, double c, double d);
	double in_out_cubic(double t, double b, double c, double d);
	double in_quart(double t, double b, double c, double d);
	double out_quart(double t, double b, double c, double d);
	double in_out_quart(double t, double b, double c, double d);
	double in_quint(double t, double b, double c, double d);
	double out_quint(double t, double b, double c, double d);
	double in_out_quint(double t, double b, double c, double d);
	double in_sine(double t, double b, double c, double d);
	double out_sine(double t, double b, double c, double d);
	double in_out_sine(double t, double b, double c, double d);
	double in_expo(double t, double b, double c, double d);
	double out_expo(double t, double b, double c, double d);
	double in_out_expo(double t, double b, double c, double d);
	double in_circ(double t, double b, double c, double d);
	double out_circ(double t, double b, double c, double d);
	double in_out_circ(double t, double b, double c, double d);
	double in_elastic(double t, double b, double c, double d);
	double out_elastic(double t, double b, double c, double d);
	double in_out_elastic(double t, double b, double c, double d);
	double in_back(double t, double b, double c, double d);
	double out_back(double t, double b, double c, double d);
	double in_out_back(double t, double b, double c, double d);
	double in_bounce(double t, double b, double c, double d);
	double out_bounce(double t, double b, double c, double d);
	double in_out_bounce(double t, double b, double c, double d);
}

}
#endif

