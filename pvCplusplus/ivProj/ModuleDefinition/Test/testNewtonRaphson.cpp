/**
 * Test on the Newton-Raphson iteration of the one-diode equation.
 */
#include "../../test.h"
#include "../../testUtils.h"
#include "../../Utils/Rootfind.h"
#include <boost/math/tools/roots.hpp>
#include <iostream>
#include <cstdint>

constexpr int ITRNUM = 4;

/// Same equation, for boost::math::tools::newton_raphson_iterate.
template <class T>
struct diode_functor
{
	diode_functor(T const& v_, struct Params p_) : v(v_), p(p_)
	{
	}
	std::pair<T, T> operator()(T const& i)
	{
		T e  = std::exp((v + i*p.Rs)/p.nVth);
		T fx = i - p.Iph + p.Io*(e - 1.0) + (v + i*p.Rs)/p.Rsh;
		T dx = 1.0 + p.Io*e*p.Rs/p.nVth + p.Rs/p.Rsh;
		return std::make_pair(fx, dx);
	}
private:
	T v;
	struct Params p;
};

int main()
{
	int failures = 0;
	bool res;
	SolverOpt opt;

	/// ELG590-M72HEP at STC with n = 1.3, Rs = 0.2, Rsh = 1000.
	double nVth = 1.3*144*KBOLTZ*(25.0 + TKELVIN0)/QELEC;
	struct Params input = { 14.31, 0.0, 0.2, nVth, 1000.0 };
	input.Io = (14.31 - 52.0/1000.0)/(std::exp(52.0/nVth) - 1.0);

	ArrayXd vSet(ITRNUM);
	vSet << 0.0, 20.0, 39.0, 45.0;
	ArrayXd iSet(ITRNUM);
	ArrayXi status(ITRNUM);

	std::cout<<"\nTesting: 1) agreement with boost newton_raphson_iterate\n";
	DiodeNewtonRaphson nrMethod(opt, input, vSet, input.Iph, iSet, status);
	nrMethod.findRoot();

	int digits = std::numeric_limits<double>::digits;
	int get_digits = (digits * 3)/4;
	ArrayXd refIset(ITRNUM);
	for (int i = 0; i < ITRNUM; i++)
	{
		std::uintmax_t maxIter = 1000;
		refIset(i) = boost::math::tools::newton_raphson_iterate(diode_functor<double>(vSet(i), input),
									 input.Iph, 0.0, 1.2*input.Iph, get_digits, maxIter);
	}
	res = ((iSet - refIset).abs() < 1e-6).all() && (status == static_cast<int>(NrStatus::converged)).all();
	REPORT(res, failures);

	std::cout<<"\nTesting: 2) continuation equals chained scalar solves\n";
	NrStatus st;
	double prev = input.Iph;
	res = true;
	for (int i = 0; i < ITRNUM; i++)
	{
		prev = nrMethod.solveAt(vSet(i), prev, st);
		res = res && (prev == iSet(i));
	}
	REPORT(res, failures);

	std::cout<<"\nTesting: 3) beyond Voc the current is pinned at zero\n";
	double iBeyond = nrMethod.solveAt(53.0, 0.0, st);
	res = (iBeyond == 0.0) && (st == NrStatus::clipped);
	REPORT(res, failures);

	std::cout<<"\nTesting: 4) iterates capped at CapFactor*Iph\n";
	struct Params leaky = input;
	leaky.Rsh = 1.0;
	DiodeNewtonRaphson nrLeaky(opt, leaky, vSet, leaky.Iph, iSet, status);
	double iCap = nrLeaky.solveAt(-100.0, leaky.Iph, st);
	res = EXPECTNUM_EQ(iCap, opt.CapFactor*leaky.Iph) && (st == NrStatus::clipped);
	REPORT(res, failures);

	std::cout<<"\nTesting: 5) non-finite step resets the current to zero\n";
	struct Params broken = input;
	broken.Io = Inf;
	DiodeNewtonRaphson nrBroken(opt, broken, vSet, broken.Iph, iSet, status);
	nrBroken.findRoot();
	res = (iSet == 0.0).all() && (status == static_cast<int>(NrStatus::nonFinite)).all();
	REPORT(res, failures);

	std::cout<<"\nTesting: 6) iteration cap without convergence\n";
	SolverOpt oneIter;
	oneIter.MaxIter = 1;
	DiodeNewtonRaphson nrShort(oneIter, input, vSet, input.Iph, iSet, status);
	double iShort = nrShort.solveAt(20.0, input.Iph, st);
	res = (st == NrStatus::maxIterReached) && std::isfinite(iShort) && (iShort > 0.0);
	REPORT(res, failures);

	std::cout<<"\nTesting: 7) seed is clamped into [0, Iph]\n";
	double iHigh = nrMethod.solveAt(0.0, 1.0e6, st);
	double iLow = nrMethod.solveAt(0.0, -1.0e6, st);
	res = EXPECTNUM_NEAR(iHigh, refIset(0), 1e-6) && EXPECTNUM_NEAR(iLow, refIset(0), 1e-6);
	REPORT(res, failures);

	return failures == 0 ? 0 : 1;
}
