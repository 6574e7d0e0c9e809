#include "OneDiodeModel.h"
#include "../Utils/LambertW.h"

OneDiodeModel::OneDiodeModel(const ModuleSpec& moduleSpec_,
	const DiodeParams& diodeParams_,
	const int& resolution_,
	const SolverOpt& solverOpt_)
	: moduleSpec(moduleSpec_), diodeParams(diodeParams_), solverOpt(solverOpt_),
	  resolution(pvMAX(resolution_, MINRESOLUTION)), adjuster(moduleSpec_, diodeParams_)
{
}

struct Params OneDiodeModel::fiveParameters(const ModuleSpec& ms, const DiodeParams& dp, double G, double Tc)
{
	ConditionAdjuster adj(ms, dp);
	struct Params p;

	p.nVth = adj.nVth(Tc);
	p.Iph  = adj.adjustedIsc(G, Tc);
	p.Rs   = dp.Rs;
	p.Rsh  = dp.Rsh;

	double VocG  = adj.adjustedVoc(G, Tc);
	double denom = std::exp(pvMAX(VocG, 0.0)/pvMAX(p.nVth, NVTFLOOR)) - 1.0;
	double numer = p.Iph - VocG/pvMAX(p.Rsh, RSHIOFLOOR);
	p.Io = pvMAX(denom > 0.0 ? numer/denom : 0.0, IOFLOOR);

	return p;
}

ArrayXd OneDiodeModel::voltageSweep(double VocG, double vocRef, int resolution_)
{
	int steps = pvMAX(resolution_, MINRESOLUTION);
	double dV = pvMAX(VocG, vocRef)*VMAXFAC/steps;

	/// i*dV rather than a running sum, so that the last voltage is exactly Vmax.
	ArrayXd vSet(steps + 1);
	for (int i = 0; i <= steps; i++)
		vSet(i) = i*dV;
	return vSet;
}

void OneDiodeModel::VoltoCurr(const struct Params& p, const SolverOpt& opt, const ArrayXd& vSet,
	ArrayXd& iSet, ArrayXi& status)
{
	iSet.resize(vSet.rows());
	status.resize(vSet.rows());

	/// The first voltage is seeded with Iph.
	DiodeNewtonRaphson nrMethod(opt, p, vSet, p.Iph, iSet, status);
	nrMethod.findRoot();
}

double OneDiodeModel::explicitCurrent(const struct Params& p, double v)
{
	double nVth = pvMAX(p.nVth, NVTFLOOR);
	double rsh  = pvMAX(p.Rsh, RSHFLOOR);

	if (p.Rs == 0.0)
		return p.Iph - p.Io*(std::exp(v/nVth) - 1.0) - v/rsh;

	double kr = rsh/(p.Rs + rsh);
	double ki = p.Rs/nVth;

	double logPar = std::log(kr*ki*p.Io) + ki*kr*(p.Iph + p.Io + v/p.Rs);
	return kr*(p.Iph + p.Io - v/rsh) - lambertW(logPar)/ki;
}

IVCurve OneDiodeModel::computeCurve(double G, double Tc) const
{
	IVCurve curve;
	curve.G  = G;
	curve.Tc = Tc;
	curve.params = fiveParameters(G, Tc);
	curve.IL   = curve.params.Iph;
	curve.VocG = adjuster.adjustedVoc(G, Tc);

	ArrayXd vSet = voltageSweep(curve.VocG, moduleSpec.vocRef, resolution);
	ArrayXd iSet;
	VoltoCurr(curve.params, solverOpt, vSet, iSet, curve.status);

	curve.pointSet.resize(vSet.rows(), colNum);
	curve.pointSet.col(colV) = vSet.matrix();
	curve.pointSet.col(colI) = iSet.matrix();
	curve.pointSet.col(colP) = (vSet*iSet).matrix();

#ifndef NDEBUG
	std::cout << "computeCurve at G = " << G << ", Tc = " << Tc
		<< ": IL is " << curve.IL << " VocG is " << curve.VocG << " Io is " << curve.params.Io
		<< " nVth is " << curve.params.nVth << "\n";
#endif
	return curve;
}
