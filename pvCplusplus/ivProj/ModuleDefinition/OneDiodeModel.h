/**
 * Modelling of a PV module with a single lumped diode.
 *
 * Solve the implicit one-diode equation along a voltage sweep for getting the I/V
 * curve at a given irradiance and cell temperature.
 *
 * Input:  ModuleSpec, DiodeParams, resolution
 * Output: IVCurve (as an input for the class CurveAnalyzer)
 */
#ifndef ONEDIODEMODEL_H
#define ONEDIODEMODEL_H

#include <iostream>
#include <vector>
#include "../Utils/pvcommutils.h"
#include "../Utils/Rootfind.h"
#include "../ElectricalCalculation/IVCurve.h"
#include "ConditionAdjuster.h"

#include <Eigen/Dense>

using namespace Eigen;

class OneDiodeModel
{
private:
	ModuleSpec  moduleSpec;
	DiodeParams diodeParams;
	SolverOpt   solverOpt;
	int         resolution; /// Number of voltage steps; the curve has resolution + 1 points.

	ConditionAdjuster adjuster;

public:
	/// Create an OneDiodeModel object. The resolution is floored at MINRESOLUTION.
	OneDiodeModel(const ModuleSpec& moduleSpec_, const DiodeParams& diodeParams_,
		const int& resolution_ = DEFRESOLUTION, const SolverOpt& solverOpt_ = SolverOpt());

	/**
	 * Iph, Io, Rs, nVth and Rsh at (G, Tc).
	 *
	 * Io = max((Iph - Voc'/Rsh)/(exp(Voc'/nVth) - 1), IOFLOOR); a non-positive
	 * denominator gives Io = IOFLOOR.
	 */
	static struct Params fiveParameters(const ModuleSpec& ms, const DiodeParams& dp, double G, double Tc);
	struct Params fiveParameters(double G, double Tc) const { return fiveParameters(moduleSpec, diodeParams, G, Tc); }

	/// Voltages i*dV, i = 0..resolution, with dV = max(Voc', Voc_ref)*VMAXFAC/resolution.
	static ArrayXd voltageSweep(double VocG, double vocRef, int resolution_);

	/// Calculate the corresponding iSet (and solver status) along the ascending vSet.
	static void VoltoCurr(const struct Params& p, const SolverOpt& opt, const ArrayXd& vSet,
		ArrayXd& iSet, ArrayXi& status);

	/// Explicit solution of the same equation via Lambert-W (no clamps).
	static double explicitCurrent(const struct Params& p, double v);

	/// Sample the I-V/P-V curve at (G, Tc). Pure: equal inputs give bit-identical curves.
	IVCurve computeCurve(double G, double Tc) const;

	double adjustedIsc(double G, double Tc) const { return adjuster.adjustedIsc(G, Tc); }
	double adjustedVoc(double G, double Tc) const { return adjuster.adjustedVoc(G, Tc); }

	const ModuleSpec&  getModuleSpec() const { return moduleSpec; }
	const DiodeParams& getDiodeParams() const { return diodeParams; }
	const SolverOpt&   getSolverOpt() const { return solverOpt; }
	int getResolution() const { return resolution; }
};

#endif
