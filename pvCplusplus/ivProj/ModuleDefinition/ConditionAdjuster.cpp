#include "ConditionAdjuster.h"

double ConditionAdjuster::nVth(double Tc) const
{
	return diodeParams.n*thermalVoltage(Tc)*pvMAX(moduleSpec.cellsSeries, 1);
}

double ConditionAdjuster::adjustedIsc(double G, double Tc) const
{
	return moduleSpec.iscRef*(G/GREF)*(1.0 + moduleSpec.alphaIsc*(Tc - TREF));
}

double ConditionAdjuster::adjustedVoc(double G, double Tc) const
{
	double thermal = moduleSpec.vocRef*(1.0 + moduleSpec.betaVoc*(Tc - TREF));
	/// G is floored so that the log term stays finite in the dark.
	double logTerm = nVth(Tc)*std::log(pvMAX(G, GLOGFLOOR)/GREF);

	return pvMAX(thermal + logTerm, VOCFLOOR);
}
