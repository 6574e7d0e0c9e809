/**
 * Fit (n, Rs, Rsh) so that the MPP of the STC curve matches a reference MPP
 * (the nameplate Vmpp/Impp by default).
 *
 * Stage 1: coarse 6x7x7 grid. Stage 2: 5x5x5 grid around the best grid point.
 * The best triplet is adopted only if it beats the starting score by more than
 * ADOPTTHLD, which makes repeated calls stop once nothing better is on the grid.
 */
#ifndef PARAMCALIBRATOR_H
#define PARAMCALIBRATOR_H

#include <vector>
#include "../Utils/pvcommutils.h"
#include "OneDiodeModel.h"

constexpr int    CALIBRESOLUTION = 140;
constexpr double ADOPTTHLD = 1e-3;

/// Physically valid ranges of the fine stage.
constexpr double NCALIBMIN   = 1.001;
constexpr double NCALIBMAX   = 1.999;
constexpr double RSCALIBMIN  = 0.005;
constexpr double RSCALIBMAX  = 1.0;
constexpr double RSHCALIBMIN = 50.0;
constexpr double RSHCALIBMAX = 100000.0;

/// Target of the calibration.
struct MppRef
{
	double vmp;
	double imp;
};

struct CalibResult
{
	DiodeParams params;
	double scoreBefore;
	double scoreAfter;
	bool adopted;
	unsigned evaluations;
};

class ParamCalibrator
{
private:
	ModuleSpec moduleSpec;
	SolverOpt  solverOpt;
	unsigned   evaluations{ 0 };

	static const std::vector<double> coarseN;
	static const std::vector<double> coarseRs;
	static const std::vector<double> coarseRsh;

	/// Search one grid, keeping the first strictly better triplet.
	void searchGrid(const std::vector<double>& nSet, const std::vector<double>& rsSet,
		const std::vector<double>& rshSet, const MppRef& ref,
		DiodeParams& best, double& bestScore, DiodeParams* gridBest = nullptr);

public:
	ParamCalibrator(const ModuleSpec& moduleSpec_, const SolverOpt& solverOpt_ = SolverOpt())
	: moduleSpec(moduleSpec_), solverOpt(solverOpt_) {}

	/**
	 * Distance between the MPP of the STC curve (CALIBRESOLUTION steps) and ref.
	 * Same Newton routine as OneDiodeModel::computeCurve, without diagnostics.
	 */
	double score(const DiodeParams& dp, const MppRef& ref);

	/// Five candidate values around a stage-1 winner, clamped to the valid ranges.
	static std::vector<double> fineN(double n);
	static std::vector<double> fineRs(double rs);
	static std::vector<double> fineRsh(double rsh);

	CalibResult calibrate(const DiodeParams& current, const MppRef& ref);
	CalibResult calibrate(const DiodeParams& current)
	{ return calibrate(current, { moduleSpec.vmppRef, moduleSpec.imppRef }); }

	/// Calibration is meant to run near STC only.
	static bool shouldCalibrate(const Condition& c) { return isNearSTC(c); }
};

/// Side-effect-free entry point: the (possibly unchanged) parameter set.
DiodeParams calibrate(const ModuleSpec& moduleSpec, const DiodeParams& diodeParams, const MppRef& reference);

#endif
