#include "ParamCalibrator.h"

const std::vector<double> ParamCalibrator::coarseN   { 1.1, 1.2, 1.3, 1.4, 1.5, 1.6 };
const std::vector<double> ParamCalibrator::coarseRs  { 0.02, 0.05, 0.1, 0.15, 0.2, 0.3, 0.4 };
const std::vector<double> ParamCalibrator::coarseRsh { 200.0, 500.0, 1000.0, 2000.0, 5000.0, 10000.0, 20000.0 };

double ParamCalibrator::score(const DiodeParams& dp, const MppRef& ref)
{
	struct Params p = OneDiodeModel::fiveParameters(moduleSpec, dp, GREF, TREF);
	double VocG = ConditionAdjuster(moduleSpec, dp).adjustedVoc(GREF, TREF);

	ArrayXd vSet = OneDiodeModel::voltageSweep(VocG, moduleSpec.vocRef, CALIBRESOLUTION);
	ArrayXd iSet;
	ArrayXi status;
	OneDiodeModel::VoltoCurr(p, solverOpt, vSet, iSet, status);

	ArrayXd pSet = vSet*iSet;
	int best = 0;
	for (int i = 1; i < pSet.rows(); i++)
		if (pSet(i) > pSet(best))
			best = i;

	++evaluations;
	return SQRT2POW(vSet(best) - ref.vmp, iSet(best) - ref.imp);
}

std::vector<double> ParamCalibrator::fineN(double n)
{
	std::vector<double> set;
	for (double d : { -0.05, -0.02, 0.0, 0.02, 0.05 })
		set.push_back(pvCLAMP(n + d, NCALIBMIN, NCALIBMAX));
	return set;
}

std::vector<double> ParamCalibrator::fineRs(double rs)
{
	std::vector<double> set;
	for (double f : { 0.7, 0.85, 1.0, 1.15, 1.3 })
		set.push_back(pvCLAMP(rs*f, RSCALIBMIN, RSCALIBMAX));
	return set;
}

std::vector<double> ParamCalibrator::fineRsh(double rsh)
{
	std::vector<double> set;
	for (double f : { 0.5, 0.75, 1.0, 1.25, 1.6 })
		set.push_back(pvCLAMP(rsh*f, RSHCALIBMIN, RSHCALIBMAX));
	return set;
}

void ParamCalibrator::searchGrid(const std::vector<double>& nSet, const std::vector<double>& rsSet,
	const std::vector<double>& rshSet, const MppRef& ref,
	DiodeParams& best, double& bestScore, DiodeParams* gridBest)
{
	double gridScore = Inf;

	for (double n : nSet)
		for (double rs : rsSet)
			for (double rsh : rshSet)
			{
				DiodeParams dp{ n, rs, rsh };
				double s = score(dp, ref);
				if (s < bestScore)
				{
					bestScore = s;
					best = dp;
				}
				if (gridBest && s < gridScore)
				{
					gridScore = s;
					*gridBest = dp;
				}
			}
}

CalibResult ParamCalibrator::calibrate(const DiodeParams& current, const MppRef& ref)
{
	CalibResult res;
	evaluations = 0;
	res.scoreBefore = score(current, ref);

	DiodeParams best = current;
	double bestScore = res.scoreBefore;

	/// The fine grid is centred on the best coarse point, not on the current
	/// parameters, so a second call searches exactly the same candidates.
	DiodeParams gridBest = current;
	searchGrid(coarseN, coarseRs, coarseRsh, ref, best, bestScore, &gridBest);
	searchGrid(fineN(gridBest.n), fineRs(gridBest.Rs), fineRsh(gridBest.Rsh), ref, best, bestScore);

	res.adopted = (res.scoreBefore - bestScore) > ADOPTTHLD;
	res.params = res.adopted ? best : current;
	res.scoreAfter = res.adopted ? bestScore : res.scoreBefore;
	res.evaluations = evaluations;

#ifndef NDEBUG
	std::cout << "calibrate: score " << res.scoreBefore << " -> " << bestScore
		<< " after " << evaluations << " evaluations, "
		<< (res.adopted ? "adopted" : "kept") << " n = " << res.params.n
		<< " Rs = " << res.params.Rs << " Rsh = " << res.params.Rsh << "\n";
#endif
	return res;
}

DiodeParams calibrate(const ModuleSpec& moduleSpec, const DiodeParams& diodeParams, const MppRef& reference)
{
	ParamCalibrator calibrator(moduleSpec);
	return calibrator.calibrate(diodeParams, reference).params;
}
