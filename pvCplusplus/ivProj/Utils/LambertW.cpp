#include "LambertW.h"
#include <boost/math/special_functions/fpclassify.hpp>

/// Newton iteration on w + log(w) = x, for x large enough that exp(x) overflows.
static double lambertWLog(double x)
{
	double w = x - std::log(x);

	for (unsigned iter = 0; iter < LWMAXITER; iter++)
	{
		double step = (w + std::log(w) - x)*w/(w + 1.0);
		w -= step;
		if (ABS(step) <= LWNEPS*EPSILONScal(w))
			return w;
	}
	return Nan;
}

double lambertW(double x)
{
	if (boost::math::isnan(x))
		return Nan;
	if (boost::math::isinf(x))
		return (x > 0.0) ? Inf : 0.0;

	double z = std::exp(x);
	if (boost::math::isinf(z))
		return lambertWLog(x);

	return boost::math::lambert_w0(z);
}
