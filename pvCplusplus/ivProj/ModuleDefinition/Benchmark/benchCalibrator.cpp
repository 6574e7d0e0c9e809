/**
 * Benchmark on the two-stage calibration and on single curve evaluations.
 */
#include "../../test.h"
#include "../../testUtils.h"
#include "../../Utils/xmlutils.h"
#include "../ParamCalibrator.h"
#include <iostream>

constexpr int ITRNUM = 1000;

int main()
{
	GetSimOptFile* filePtr = GetSimOptFile::Instance();
	filePtr->openOptionFile(std::string(IV_RESOURCE_DIR) + "/SimOption.xml");
	filePtr->readOptionFile();

	ModuleSpec ms = filePtr->getModuleSpec();
	DiodeParams dp = filePtr->getDiodeParams();
	double start, end;

	std::cout<<"\nBenchmarking: computeCurve at STC\n";
	OneDiodeModel odm(ms, dp, filePtr->getResolution(), filePtr->getSolverOpt());
	double pmpSum = 0.0;
	TIMESTAMP( start );
	for (int i = 0; i < ITRNUM; i++)
		pmpSum += odm.computeCurve(GREF, TREF).pointSet.col(colP).maxCoeff();
	TIMESTAMP( end );
	std::cout<<"The elapsed time is "<<end - start<<" s for "<<ITRNUM<<" curves (mean Pmp "<<pmpSum/ITRNUM<<")\n";

	std::cout<<"\nBenchmarking: calibrate\n";
	ParamCalibrator calibrator(ms, filePtr->getSolverOpt());
	TIMESTAMP( start );
	CalibResult cr = calibrator.calibrate(dp);
	TIMESTAMP( end );
	std::cout<<"The elapsed time is "<<end - start<<" s for "<<cr.evaluations<<" evaluations\n";
}
