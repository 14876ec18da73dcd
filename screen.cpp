// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#include <simple-easing-plot/screen.h>

#include <stdexcept>
#include <string>

using namespace SimpleEasingPlot;

Screen::Screen(unsigned int width, unsigned int height):
	w(width), h(height)
{
	if (width < Size_Min || height < Size_Min)
		throw std::invalid_argument("Screen::Screen(): the size is smaller than "
		                            + std::to_string(Size_Min) + " px.");

	this->gr = Graph(width, height);
	this->buf_front = create_buffer(width, height);
	this->buf_cache = create_buffer(width, height);

	// make sure a usable 2D context can be created on the front buffer
	Cairo::RefPtr<Cairo::Context> cr = this->front_context();
	cairo_status_t status = cairo_status(cr->cobj());
	if (status != CAIRO_STATUS_SUCCESS)
		throw std::runtime_error(std::string("Screen::Screen(): no usable drawing context: ")
		                         + cairo_status_to_string(status));

	cr->set_source_rgb(1.0, 1.0, 1.0); cr->paint();
	this->save_to_cache();
}

/*------------------------------ private functions ------------------------------*/

Cairo::RefPtr<Cairo::ImageSurface> Screen::create_buffer(unsigned int width, unsigned int height)
{
	// no alpha channel; cairomm throws if the surface can't be created at all
	Cairo::RefPtr<Cairo::ImageSurface> surface =
		Cairo::ImageSurface::create(Cairo::FORMAT_RGB24, width, height);

	cairo_status_t status = cairo_surface_status(surface->cobj());
	if (status != CAIRO_STATUS_SUCCESS)
		throw std::runtime_error(std::string("Screen::create_buffer(): ")
		                         + cairo_status_to_string(status));
	return surface;
}

void Screen::copy(const Cairo::RefPtr<Cairo::ImageSurface>& src, const Cairo::RefPtr<Cairo::ImageSurface>& dest)
{
	Cairo::RefPtr<Cairo::Context> cr = Cairo::Context::create(dest);
	cr->set_operator(Cairo::OPERATOR_SOURCE);
	cr->set_source(src, 0, 0);
	cr->paint();
	dest->flush();
}
