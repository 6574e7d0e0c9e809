/**
 * Test on the correction of Isc and Voc for irradiance and temperature.
 */
#include "../../test.h"
#include "../../testUtils.h"
#include "../ConditionAdjuster.h"
#include <iostream>

int main()
{
	int failures = 0;
	bool res;
	ModuleSpec ms = elg590Module();
	ConditionAdjuster adj(ms, elg590Diode());

	std::cout<<"\nTesting: 1) thermal voltage and nVth at 25 degC\n";
	res = EXPECTNUM_NEAR(ConditionAdjuster::thermalVoltage(25.0), 0.0256926, 1e-6)
				&& EXPECTNUM_NEAR(adj.nVth(25.0), 1.3*144*ConditionAdjuster::thermalVoltage(25.0), 1e-12);
	REPORT(res, failures);

	std::cout<<"\nTesting: 2) nameplate values at STC\n";
	res = EXPECTNUM_EQ(adj.adjustedIsc(1000.0, 25.0), 14.31)
				&& EXPECTNUM_EQ(adj.adjustedVoc(1000.0, 25.0), 52.0);
	REPORT(res, failures);

	std::cout<<"\nTesting: 3) half irradiance\n";
	double voc500 = adj.adjustedVoc(500.0, 25.0);
	res = EXPECTNUM_EQ(adj.adjustedIsc(500.0, 25.0), 7.155)
				&& (voc500 < 52.0)
				&& EXPECTNUM_NEAR(52.0 - voc500, adj.nVth(25.0)*std::log(2.0), 1e-9);
	REPORT(res, failures);

	std::cout<<"\nTesting: 4) hot module (75 degC)\n";
	double isc75 = adj.adjustedIsc(1000.0, 75.0);
	double voc75 = adj.adjustedVoc(1000.0, 75.0);
	res = (isc75 > ms.iscRef) && EXPECTNUM_EQ(isc75, 14.31*(1.0 + 0.00046*50.0))
				&& (voc75 < ms.vocRef) && EXPECTNUM_EQ(voc75, 52.0*(1.0 - 0.0026*50.0));
	REPORT(res, failures);

	std::cout<<"\nTesting: 5) zero irradiance keeps Voc finite\n";
	double voc0 = adj.adjustedVoc(0.0, 25.0);
	res = EXPECTNUM_EQ(adj.adjustedIsc(0.0, 25.0), 0.0)
				&& std::isfinite(voc0)
				&& EXPECTNUM_NEAR(voc0, adj.adjustedVoc(1.0, 25.0), 1e-12);
	REPORT(res, failures);

	std::cout<<"\nTesting: 6) Voc floored at 0.1 V\n";
	ModuleSpec tiny = ms;
	tiny.vocRef = 1.0;
	ConditionAdjuster adjTiny(tiny, elg590Diode());
	res = EXPECTNUM_EQ(adjTiny.adjustedVoc(1.0, 25.0), VOCFLOOR)
				&& EXPECTNUM_EQ(adjTiny.adjustedVoc(1000.0, 25.0), 1.0);
	REPORT(res, failures);

	std::cout<<"\nTesting: 7) cell count floored at one\n";
	ModuleSpec noCells = ms;
	noCells.cellsSeries = 0;
	ConditionAdjuster adjNoCells(noCells, elg590Diode());
	res = EXPECTNUM_NEAR(adjNoCells.nVth(25.0), 1.3*ConditionAdjuster::thermalVoltage(25.0), 1e-12);
	REPORT(res, failures);

	return failures == 0 ? 0 : 1;
}
