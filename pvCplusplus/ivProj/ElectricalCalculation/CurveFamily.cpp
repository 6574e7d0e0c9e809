#include "CurveFamily.h"
#include <omp.h>

const std::vector<double> CurveFamily::DEFIRRADIANCES  { 1000.0, 800.0, 600.0, 400.0, 200.0 };
const std::vector<double> CurveFamily::DEFTEMPERATURES { 75.0, 65.0, 55.0, 45.0, 35.0, 25.0 };

std::vector<IVCurve> CurveFamily::sweep(const std::vector<Condition>& conds) const
{
	int famSize = static_cast<int>(conds.size());
	std::vector<IVCurve> curves(famSize);

#pragma omp parallel for schedule(dynamic) if (famSize > 1)
	for (int i = 0; i < famSize; i++)
		curves[i] = odm.computeCurve(conds[i].G, conds[i].Tc);

	return curves;
}

std::vector<IVCurve> CurveFamily::irradianceSweep(const std::vector<double>& levels, double Tc) const
{
	std::vector<Condition> conds;
	for (double G : levels)
		conds.push_back({ G, Tc });
	return sweep(conds);
}

std::vector<IVCurve> CurveFamily::temperatureSweep(const std::vector<double>& levels, double G) const
{
	std::vector<Condition> conds;
	for (double Tc : levels)
		conds.push_back({ G, Tc });
	return sweep(conds);
}
