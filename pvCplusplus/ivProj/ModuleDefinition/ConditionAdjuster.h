/**
 * Correction of the nameplate Isc and Voc for the operating condition (G, Tc).
 *
 * Isc' = Isc_ref*(G/Gref)*(1 + alphaIsc*(Tc - Tref))
 * Voc' = max(Voc_ref*(1 + betaVoc*(Tc - Tref)) + n*Vt(Tc)*Ns*log(max(G, 1)/Gref), 0.1)
 */
#ifndef CONDITIONADJUSTER_H
#define CONDITIONADJUSTER_H

#include "../Utils/pvcommutils.h"

class ConditionAdjuster
{
private:
	ModuleSpec  moduleSpec;
	DiodeParams diodeParams; /// Only n is used.

public:
	ConditionAdjuster(const ModuleSpec& moduleSpec_, const DiodeParams& diodeParams_)
	: moduleSpec(moduleSpec_), diodeParams(diodeParams_) {}

	/// Thermal voltage kT/q of one cell.
	static double thermalVoltage(double Tc) { return KBOLTZ*(Tc + TKELVIN0)/QELEC; }

	/// n*Vt*Ns, the thermal voltage of the module-level diode.
	double nVth(double Tc) const;

	double adjustedIsc(double G, double Tc) const;
	double adjustedVoc(double G, double Tc) const;
};

#endif
