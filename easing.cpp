// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/easing.h>

#include <cmath>

using namespace SimpleEasingPlot;

// classic tweening equations. t: elapsed, b: start value, c: value delta, d: duration

namespace {
	const double Pi = 3.14159265358979323846;
	const double Back_Overshoot = 1.70158;
}

double Easing::in_quad(double t, double b, double c, double d)
{
	t /= d;
	return c*t*t + b;
}

double Easing::out_quad(double t, double b, double c, double d)
{
	t /= d;
	return -c*t*(t - 2) + b;
}

double Easing::in_out_quad(double t, double b, double c, double d)
{
	t /= d / 2;
	if (t < 1) return c/2*t*t + b;
	t -= 1;
	return -c/2*(t*(t - 2) - 1) + b;
}

double Easing::in_cubic(double t, double b, double c, double d)
{
	t /= d;
	return c*t*t*t + b;
}

double Easing::out_cubic(double t, double b, double c, double d)
{
	t = t/d - 1;
	return c*(t*t*t + 1) + b;
}

double Easing::in_out_cubic(double t, double b, double c, double d)
{
	t /= d / 2;
	if (t < 1) return c/2*t*t*t + b;
	t -= 2;
	return c/2*(t*t*t + 2) + b;
}

double Easing::in_quart(double t, double b, double c, double d)
{
	t /= d;
	return c*t*t*t*t + b;
}

double Easing::out_quart(double t, double b, double c, double d)
{
	t = t/d - 1;
	return -c*(t*t*t*t - 1) + b;
}

double Easing::in_out_quart(double t, double b, double c, double d)
{
	t /= d / 2;
	if (t < 1) return c/2*t*t*t*t + b;
	t -= 2;
	return -c/2*(t*t*t*t - 2) + b;
}

double Easing::in_quint(double t, double b, double c, double d)
{
	t /= d;
	return c*t*t*t*t*t + b;
}

double Easing::out_quint(double t, double b, double c, double d)
{
	t = t/d - 1;
	return c*(t*t*t*t*t + 1) + b;
}

double Easing::in_out_quint(double t, double b, double c, double d)
{
	t /= d / 2;
	if (t < 1) return c/2*t*t*t*t*t + b;
	t -= 2;
	return c/2*(t*t*t*t*t + 2) + b;
}

double Easing::in_sine(double t, double b, double c, double d)
{
	return -c*std::cos(t/d * (Pi/2)) + c + b;
}

double Easing::out_sine(double t, double b, double c, double d)
{
	return c*std::sin(t/d * (Pi/2)) + b;
}

double Easing::in_out_sine(double t, double b, double c, double d)
{
	return -c/2*(std::cos(Pi*t/d) - 1) + b;
}

double Easing::in_expo(double t, double b, double c, double d)
{
	if (t == 0) return b;
	return c*std::pow(2, 10*(t/d - 1)) + b;
}

double Easing::out_expo(double t, double b, double c, double d)
{
	if (t == d) return b + c;
	return c*(-std::pow(2, -10*t/d) + 1) + b;
}

double Easing::in_out_expo(double t, double b, double c, double d)
{
	if (t == 0) return b;
	if (t == d) return b + c;
	t /= d / 2;
	if (t < 1) return c/2*std::pow(2, 10*(t - 1)) + b;
	t -= 1;
	return c/2*(-std::pow(2, -10*t) + 2) + b;
}

double Easing::in_circ(double t, double b, double c, double d)
{
	t /= d;
	return -c*(std::sqrt(1 - t*t) - 1) + b;
}

double Easing::out_circ(double t, double b, double c, double d)
{
	t = t/d - 1;
	return c*std::sqrt(1 - t*t) + b;
}

double Easing::in_out_circ(double t, double b, double c, double d)
{
	t /= d / 2;
	if (t < 1) return -c/2*(std::sqrt(1 - t*t) - 1) + b;
	t -= 2;
	return c/2*(std::sqrt(1 - t*t) + 1) + b;
}

// amplitude equals the delta, so the phase shift is always a quarter period
double Easing::in_elastic(double t, double b, double c, double d)
{
	if (t == 0) return b;
	t /= d;
	if (t == 1) return b + c;
	double p = d * 0.3, s = p / 4;
	t -= 1;
	return -(c*std::pow(2, 10*t) * std::sin((t*d - s)*(2*Pi)/p)) + b;
}

double Easing::out_elastic(double t, double b, double c, double d)
{
	if (t == 0) return b;
	t /= d;
	if (t == 1) return b + c;
	double p = d * 0.3, s = p / 4;
	return c*std::pow(2, -10*t) * std::sin((t*d - s)*(2*Pi)/p) + c + b;
}

double Easing::in_out_elastic(double t, double b, double c, double d)
{
	if (t == 0) return b;
	t /= d / 2;
	if (t == 2) return b + c;
	double p = d * (0.3 * 1.5), s = p / 4;
	if (t < 1) {
		t -= 1;
		return -0.5*(c*std::pow(2, 10*t) * std::sin((t*d - s)*(2*Pi)/p)) + b;
	}
	t -= 1;
	return c*std::pow(2, -10*t) * std::sin((t*d - s)*(2*Pi)/p)*0.5 + c + b;
}

double Easing::in_back(double t, double b, double c, double d)
{
	double s = Back_Overshoot;
	t /= d;
	return c*t*t*((s + 1)*t - s) + b;
}

double Easing::out_back(double t, double b, double c, double d)
{
	double s = Back_Overshoot;
	t = t/d - 1;
	return c*(t*t*((s + 1)*t + s) + 1) + b;
}

double Easing::in_out_back(double t, double b, double c, double d)
{
	double s = Back_Overshoot * 1.525;
	t /= d / 2;
	if (t < 1) return c/2*(t*t*((s + 1)*t - s)) + b;
	t -= 2;
	return c/2*(t*t*((s + 1)*t + s) + 2) + b;
}

double Easing::out_bounce(double t, double b, double c, double d)
{
	t /= d;
	if (t < 1 / 2.75)
		return c*(7.5625*t*t) + b;
	else if (t < 2 / 2.75) {
		t -= 1.5 / 2.75;
		return c*(7.5625*t*t + 0.75) + b;
	} else if (t < 2.5 / 2.75) {
		t -= 2.25 / 2.75;
		return c*(7.5625*t*t + 0.9375) + b;
	} else {
		t -= 2.625 / 2.75;
		return c*(7.5625*t*t + 0.984375) + b;
	}
}

double Easing::in_bounce(double t, double b, double c, double d)
{
	return c - out_bounce(d - t, 0, c, d) + b;
}

double Easing::in_out_bounce(double t, double b, double c, double d)
{
	if (t < d / 2) return in_bounce(t*2, 0, c, d)*0.5 + b;
	return out_bounce(t*2 - d, 0, c, d)*0.5 + c*0.5 + b;
}

/*------------------------------ catalogue ------------------------------*/

const std::vector<EasingEntry>& SimpleEasingPlot::easing_catalogue()
{
	static const std::vector<EasingEntry> catalogue = {
		{"easeInQuad", &Easing::in_quad},
		{"easeOutQuad", &Easing::out_quad},
		{"easeInOutQuad", &Easing::in_out_quad},
		{"easeInCubic", &Easing::in_cubic},
		{"easeOutCubic", &Easing::out_cubic},
		{"easeInOutCubic", &Easing::in_out_cubic},
		{"easeInQuart", &Easing::in_quart},
		{"easeOutQuart", &Easing::out_quart},
		{"easeInOutQuart", &Easing::in_out_quart},
		{"easeInQuint", &Easing::in_quint},
		{"easeOutQuint", &Easing::out_quint},
		{"easeInOutQuint", &Easing::in_out_quint},
		{"easeInSine", &Easing::in_sine},
		{"easeOutSine", &Easing::out_sine},
		{"easeInOutSine", &Easing::in_out_sine},
		{"easeInExpo", &Easing::in_expo},
		{"easeOutExpo", &Easing::out_expo},
		{"easeInOutExpo", &Easing::in_out_expo},
		{"easeInCirc", &Easing::in_circ},
		{"easeOutCirc", &Easing::out_circ},
		{"easeInOutCirc", &Easing::in_out_circ},
		{"easeInElastic", &Easing::in_elastic},
		{"easeOutElastic", &Easing::out_elastic},
		{"easeInOutElastic", &Easing::in_out_elastic},
		{"easeInBack", &Easing::in_back},
		{"easeOutBack", &Easing::out_back},
		{"easeInOutBack", &Easing::in_out_back},
		{"easeInBounce", &Easing::in_bounce},
		{"easeOutBounce", &Easing::out_bounce},
		{"easeInOutBounce", &Easing::in_out_bounce}
	};
	return catalogue;
}

EasingFunc SimpleEasingPlot::find_easing(const std::string& name)
{
	for (const EasingEntry& entry : easing_catalogue())
		if (entry.name == name) return entry.func;
	return NULL;
}
