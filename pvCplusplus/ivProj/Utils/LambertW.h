/**
 * Lambert-W function of an exponential, W(exp(x)).
 *
 * Taking log(z) instead of z keeps the explicit one-diode solution usable when
 * exp(x) overflows a double.
 */
#ifndef LAMBERTW_H_
#define LAMBERTW_H_

#include "pvcommutils.h"
#include <boost/math/special_functions/lambert_w.hpp>

constexpr unsigned LWMAXITER = 1000;
constexpr int LWNEPS = 3;

double lambertW(double x);

#endif
