/**
 * Root-finding of the one-diode equation.
 *
 * F(I) = I - Iph + Io*(exp((V + I*Rs)/nVth) - 1) + (V + I*Rs)/Rsh = 0
 *
 * DiodeNewtonRaphson: Newton iteration for a sweep of voltages (scalar processing),
 * each voltage seeded with the root of the previous one.
 */

#ifndef ROOTFIND_H_
#define ROOTFIND_H_

#include <Eigen/Dense>
#include <boost/math/special_functions/fpclassify.hpp>
#include "pvcommutils.h"

using namespace Eigen;

/// Outcome of the iteration at one voltage.
enum NrStatus
{
	converged = 0,  /// |step| < StepTol
	clipped,        /// iteration cap reached while pinned at a clamp (I = 0 or I = CapFactor*Iph)
	maxIterReached, /// iteration cap reached
	nonFinite,      /// reset to zero after a non-finite step
	nrStatusNum
};

class GeneralRootFind
{
protected:
	SolverOpt opt;
public:
	GeneralRootFind(const SolverOpt& opt_) : opt(opt_) {};
	virtual ~GeneralRootFind() = default;
	virtual void findRoot() = 0;
};

class DiodeNewtonRaphson : public GeneralRootFind
{
private:
	struct Params inputP;
	ArrayXd givenSet; /// Voltages, ascending.
	double seed;      /// Seed of the first voltage.
	Ref<ArrayXd> root;
	Ref<ArrayXi> status;

public:
	DiodeNewtonRaphson(const SolverOpt& opt_, const struct Params inputP_,
		const ArrayXd& givenSet_, double seed_, Ref<ArrayXd> root_, Ref<ArrayXi> status_)
	: GeneralRootFind(opt_), inputP(inputP_), givenSet(givenSet_), seed(seed_), root(root_), status(status_) {}

	/**
	 * Solve F(I) = 0 at the voltage v.
	 *
	 * The seed is clamped into [0, Iph]. The exponent argument is clamped to
	 * [-ExpArgLim, ExpArgLim] and F' is floored at DFFLOOR. After each step the
	 * iterate is reset to zero below -NegSlack and capped at CapFactor*Iph.
	 *
	 * @return max(I, 0).
	 */
	double solveAt(double v, double seed_, NrStatus& st) const
	{
		const double nVth = pvMAX(inputP.nVth, NVTFLOOR);
		const double rsh  = pvMAX(inputP.Rsh, RSHFLOOR);
		const double cap  = opt.CapFactor*inputP.Iph;

		double i = pvMIN(pvMAX(seed_, 0.0), pvMAX(inputP.Iph, 0.0));
		st = NrStatus::maxIterReached;

		for (unsigned iter = 0; iter < opt.MaxIter; iter++)
		{
			double vd = v + i*inputP.Rs;
			double expArg = std::exp(pvCLAMP(vd/nVth, -opt.ExpArgLim, opt.ExpArgLim));
			double fx = i - inputP.Iph + inputP.Io*(expArg - 1.0) + vd/rsh;
			double dx = 1.0 + inputP.Io*expArg*inputP.Rs/nVth + inputP.Rs/rsh;
			double step = fx/pvMAX(dx, DFFLOOR);

			if (!boost::math::isfinite(step) || !boost::math::isfinite(i - step))
			{
				i = 0.0;
				st = NrStatus::nonFinite;
				break;
			}
			i -= step;

			bool pinned = false;
			if (i < -opt.NegSlack)
			{
				i = 0.0;
				pinned = true;
			}
			else if (i > cap)
			{
				i = cap;
				pinned = true;
			}

			if (ABS(step) < opt.StepTol)
			{
				st = NrStatus::converged;
				break;
			}
			st = pinned ? NrStatus::clipped : NrStatus::maxIterReached;
		}
		return pvMAX(i, 0.0);
	}

	virtual void findRoot()
	{
		int setSize = givenSet.rows();
		double prev = seed;
		NrStatus st;

		/// Each voltage is seeded with the root of the previous one.
		for (int i = 0; i < setSize; i++)
		{
			prev = solveAt(givenSet(i), prev, st);
			root(i) = prev;
			status(i) = st;
		}
	}
};

#endif
