/**
 * Commonly-used utilities
 */
#ifndef PV_COMMUTILS_H_
#define PV_COMMUTILS_H_

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <numeric>
#include <algorithm>

/// Nameplate parameters of the module, measured at STC.
struct ModuleSpec
{
	double vocRef;
	double iscRef;
	double vmppRef;
	double imppRef;
	double area;        /// m^2
	int    cellsSeries;
	double alphaIsc;    /// Fraction per degC (positive).
	double betaVoc;     /// Fraction per degC (negative).
};

/// Tunable parameters of the lumped diode.
struct DiodeParams
{
	double n;
	double Rs;
	double Rsh;
};

/// Operating condition: irradiance (W/m^2) and cell temperature (degC).
struct Condition
{
	double G;
	double Tc;
};

/// The structure of the input parameters for the one-diode equation at a given condition.
struct Params
{
	double Iph;
	double Io;
	double Rs;
	double nVth;
	double Rsh;
};

/// Options of the Newton iteration (element 'PrecTol' in SimOption.xml).
struct SolverOpt
{
	unsigned MaxIter{ 80 };
	double   StepTol{ 1e-8 };
	double   ExpArgLim{ 50.0 }; /// Clamp of the exponent argument.
	double   NegSlack{ 0.1 };   /// Iterates below -NegSlack are reset to zero.
	double   CapFactor{ 1.2 };  /// Iterates are capped at CapFactor*Iph.
};

/// Physical constants
constexpr double QELEC  = 1.602176634e-19; /// Elementary charge (C).
constexpr double KBOLTZ = 1.380649e-23;    /// Boltzmann constant (J/K).
constexpr double TKELVIN0 = 273.15;

/// Standard Test Conditions
constexpr double GREF = 1000.0;
constexpr double TREF = 25.0;
constexpr double NEARSTCGREL = 0.02;
constexpr double NEARSTCTABS = 1.0;

/// Floors and clamps of the model.
constexpr double NVTFLOOR   = 1e-9;
constexpr double RSHFLOOR   = 1e-9;
constexpr double RSHIOFLOOR = 1e-6;
constexpr double DFFLOOR    = 1e-12;
constexpr double IOFLOOR    = 1e-12;
constexpr double FFFLOOR    = 1e-9;
constexpr double GLOGFLOOR  = 1.0;
constexpr double VOCFLOOR   = 0.1;
constexpr double VMAXFAC    = 1.02;
constexpr int    MINRESOLUTION = 10;
constexpr int    DEFRESOLUTION = 140;

constexpr auto Inf = std::numeric_limits<double>::infinity();
constexpr auto Nan = std::numeric_limits<double>::quiet_NaN();

const auto EPSILON1 = std::nextafter(1.0, 2.0) - 1.0; /// Equals to eps(1) in Matlab.
const auto EPSILON0 = std::nextafter(0.0, 1.0); /// Equals to eps(0) in Matlab.

template<class Number>
inline Number EPSILONScal(const Number x)
{ return std::nextafter(x, x+1.0) - x; }

/// \brief Template class and macro for the math expression.
template<class Number>
inline Number ABS(const Number x) { return std::abs(x);  }
template<class Number>
inline Number pvMIN(const Number x, const Number y) { return std::min(x, y); }
template<class Number>
inline Number pvMAX(const Number x, const Number y) { return std::max(x, y); }
template<class Number>
inline Number pvCLAMP(const Number x, const Number lo, const Number hi) { return pvMIN(pvMAX(x, lo), hi); }

template < class Real >
inline Real POW2(const Real x) { return (x*x); }
template <class Real>
inline Real SQRT2POW(const Real x, const Real y) { return std::sqrt(POW2(x) + POW2(y));  }

/// Within 2% of 1000 W/m^2 and 1 degC of 25 degC.
inline bool isNearSTC(const Condition& c)
{
	return (ABS(c.G - GREF) <= NEARSTCGREL*GREF) && (ABS(c.Tc - TREF) <= NEARSTCTABS);
}

/// Raised by the option file loader only. The model itself clamps instead.
class ConfigurationError : public std::runtime_error
{
public:
	explicit ConfigurationError(const std::string& what_) : std::runtime_error(what_) {}
};

#define THROWCFGERROR(message) \
do { \
	throw ConfigurationError(std::string("Error: on function ") + __FUNCTION__ + message); \
} while(false)

#endif
