/**
 * Test on the two-stage grid calibration of (n, Rs, Rsh).
 */
#include "../../test.h"
#include "../../testUtils.h"
#include "../ParamCalibrator.h"
#include "../../ElectricalCalculation/CurveAnalyzer.h"
#include <iostream>

int main()
{
	int failures = 0;
	bool res;
	ModuleSpec ms = elg590Module();
	DiodeParams dp = elg590Diode();
	ParamCalibrator calibrator(ms);

	std::cout<<"\nTesting: 1) calibration towards the nameplate MPP\n";
	CalibResult first = calibrator.calibrate(dp);
	res = first.adopted && (first.scoreAfter <= first.scoreBefore)
				&& (first.scoreBefore - first.scoreAfter > ADOPTTHLD)
				&& (first.evaluations == 1 + 6*7*7 + 5*5*5)
				&& EXPECTNUM_EQ(calibrator.score(first.params, { ms.vmppRef, ms.imppRef }), first.scoreAfter);
	std::cout<<"n is "<<first.params.n<<" Rs is "<<first.params.Rs<<" Rsh is "<<first.params.Rsh
					 <<" score "<<first.scoreBefore<<" -> "<<first.scoreAfter<<std::endl;
	REPORT(res, failures);

	std::cout<<"\nTesting: 2) a second calibration keeps the parameters\n";
	CalibResult second = calibrator.calibrate(first.params);
	res = !second.adopted
				&& (second.params.n == first.params.n) && (second.params.Rs == first.params.Rs)
				&& (second.params.Rsh == first.params.Rsh)
				&& (second.scoreAfter == second.scoreBefore);
	REPORT(res, failures);

	std::cout<<"\nTesting: 3) the calibrated curve meets the nameplate at STC\n";
	OneDiodeModel odm(ms, first.params);
	CurveAnalyzer analyzer(ms);
	CurveIndicators ind = analyzer.analyze(odm.computeCurve(1000.0, 25.0));
	res = EXPECTREL_NEAR(ind.mpp.vmp, ms.vmppRef, 0.05) && EXPECTREL_NEAR(ind.mpp.imp, ms.imppRef, 0.05)
				&& (ind.fillFactor >= 0.70) && (ind.fillFactor <= 0.82)
				&& (ind.efficiency >= 0.18) && (ind.efficiency <= 0.23)
				&& (ind.find("mppVoltageRef") != nullptr) && ind.find("mppVoltageRef")->passed
				&& (ind.find("mppCurrentRef") != nullptr) && ind.find("mppCurrentRef")->passed
				&& ind.allPassed();
	analyzer.dispRes(ind);
	REPORT(res, failures);

	std::cout<<"\nTesting: 4) a reachable reference is recovered exactly\n";
	IVCurve target = OneDiodeModel(ms, { 1.2, 0.1, 2000.0 }, CALIBRESOLUTION).computeCurve(1000.0, 25.0);
	MppInfo tmpp = CurveAnalyzer::getMpp(target);
	CalibResult exact = calibrator.calibrate(dp, { tmpp.vmp, tmpp.imp });
	res = exact.adopted && (exact.scoreAfter < 1e-9)
				&& (calibrate(ms, dp, { tmpp.vmp, tmpp.imp }).n == exact.params.n);
	REPORT(res, failures);

	std::cout<<"\nTesting: 5) fine candidates are clamped to the valid ranges\n";
	std::vector<double> nSet = ParamCalibrator::fineN(1.98);
	std::vector<double> rsSet = ParamCalibrator::fineRs(0.006);
	std::vector<double> rshSet = ParamCalibrator::fineRsh(90000.0);
	res = (nSet.size() == 5) && (rsSet.size() == 5) && (rshSet.size() == 5)
				&& EXPECTNUM_EQ(nSet[0], 1.93) && EXPECTNUM_EQ(nSet[2], 1.98)
				&& (nSet[3] == NCALIBMAX) && (nSet[4] == NCALIBMAX)
				&& (rsSet[0] == RSCALIBMIN) && EXPECTNUM_NEAR(rsSet[4], 0.0078, 1e-12)
				&& EXPECTNUM_EQ(rshSet[0], 45000.0) && (rshSet[3] == RSHCALIBMAX) && (rshSet[4] == RSHCALIBMAX);
	nSet = ParamCalibrator::fineN(1.1);
	res = res && EXPECTNUM_EQ(nSet[0], 1.05) && EXPECTNUM_EQ(nSet[4], 1.15)
				&& (ParamCalibrator::fineRsh(60.0)[0] == RSHCALIBMIN);
	REPORT(res, failures);

	std::cout<<"\nTesting: 6) calibration is meant for conditions near STC\n";
	res = ParamCalibrator::shouldCalibrate({ 1000.0, 25.0 })
				&& ParamCalibrator::shouldCalibrate({ 1015.0, 25.5 })
				&& ParamCalibrator::shouldCalibrate({ 985.0, 24.2 })
				&& !ParamCalibrator::shouldCalibrate({ 1030.0, 25.0 })
				&& !ParamCalibrator::shouldCalibrate({ 1000.0, 26.5 })
				&& !ParamCalibrator::shouldCalibrate({ 500.0, 25.0 });
	REPORT(res, failures);

	return failures == 0 ? 0 : 1;
}
