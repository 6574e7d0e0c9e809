/**
 * Comparative curves of one module at several operating conditions.
 *
 * Every member is an independent OneDiodeModel::computeCurve; members are solved
 * in parallel and returned in the order of the requested conditions.
 */
#ifndef CURVEFAMILY_H_
#define CURVEFAMILY_H_

#include <vector>
#include "../Utils/pvcommutils.h"
#include "../ModuleDefinition/OneDiodeModel.h"
#include "IVCurve.h"

class CurveFamily
{
private:
	OneDiodeModel odm;

public:
	static const std::vector<double> DEFIRRADIANCES;  /// W/m^2, at TREF.
	static const std::vector<double> DEFTEMPERATURES; /// degC, at GREF.

	explicit CurveFamily(const OneDiodeModel& odm_) : odm(odm_) {}

	std::vector<IVCurve> sweep(const std::vector<Condition>& conds) const;

	std::vector<IVCurve> irradianceSweep(const std::vector<double>& levels = DEFIRRADIANCES,
		double Tc = TREF) const;
	std::vector<IVCurve> temperatureSweep(const std::vector<double>& levels = DEFTEMPERATURES,
		double G = GREF) const;
};

#endif
