/**
 * Command-line front end of the I-V curve simulator.
 *
 * Usage: ivCurveSim [SimOption.xml] [curve.csv]
 *
 * Reads the option file, calibrates (n, Rs, Rsh) when the condition is near STC,
 * prints the indicators and diagnostics of the curve and the MPP of the
 * irradiance and temperature families. The (V, I, P) table is written as CSV
 * when a second argument is given.
 */
#include "../Utils/xmlutils.h"
#include "../ModuleDefinition/OneDiodeModel.h"
#include "../ModuleDefinition/ParamCalibrator.h"
#include "../ElectricalCalculation/CurveAnalyzer.h"
#include "../ElectricalCalculation/CurveFamily.h"
#include <fstream>
#include <iomanip>

static void dispFamily(const std::string& title, const std::vector<IVCurve>& fam)
{
	std::cout << "\n" << title << "\n";
	std::cout << std::setw(10) << "G" << std::setw(8) << "Tc" << std::setw(10) << "Vmp"
		<< std::setw(10) << "Imp" << std::setw(10) << "Pmp" << "\n";
	for (const IVCurve& c : fam)
	{
		MppInfo mpp = CurveAnalyzer::getMpp(c);
		std::cout << std::fixed << std::setprecision(2)
			<< std::setw(10) << c.G << std::setw(8) << c.Tc << std::setw(10) << mpp.vmp
			<< std::setw(10) << mpp.imp << std::setw(10) << mpp.pmp << "\n";
	}
	std::cout.unsetf(std::ios::floatfield);
	std::cout << std::setprecision(6);
}

static void writeCsv(const std::string& path, const IVCurve& curve)
{
	std::ofstream ofs(path);
	if (!ofs)
		throw std::runtime_error("Error: cannot open " + path + " for writing");

	IOFormat csvFmt(FullPrecision, DontAlignCols, ",", "\n");
	ofs << "V,I,P\n" << curve.pointSet.format(csvFmt) << "\n";
	if (!ofs)
		throw std::runtime_error("Error: failed writing " + path);
}

int main(int argc, char* argv[])
{
	std::string optFile = (argc > 1) ? argv[1] : "Resources/SimOption.xml";

	GetSimOptFile* filePtr = GetSimOptFile::Instance();
	try {
		filePtr->openOptionFile(optFile);
		filePtr->readOptionFile();
	} catch (const ConfigurationError& e) {
		std::cerr << e.what() << std::endl;
		return 1;
	}

	ModuleSpec  ms   = filePtr->getModuleSpec();
	DiodeParams dp   = filePtr->getDiodeParams();
	Condition   cond = filePtr->getCondition();
	SolverOpt   opt  = filePtr->getSolverOpt();

	std::cout << "Module: Voc " << ms.vocRef << " V, Isc " << ms.iscRef << " A, Vmpp " << ms.vmppRef
		<< " V, Impp " << ms.imppRef << " A, " << ms.cellsSeries << " cells\n";
	std::cout << "Condition: G " << cond.G << " W/m2, Tc " << cond.Tc << " degC\n";

	if (ParamCalibrator::shouldCalibrate(cond))
	{
		ParamCalibrator calibrator(ms, opt);
		CalibResult cr = calibrator.calibrate(dp);
		if (cr.adopted)
		{
			std::cout << "Calibration adopted (score " << cr.scoreBefore << " -> " << cr.scoreAfter
				<< "): n = " << cr.params.n << " Rs = " << cr.params.Rs << " Rsh = " << cr.params.Rsh << "\n";
			filePtr->setDiodeParams(cr.params);
			dp = cr.params;
		}
		else
			std::cout << "Calibration kept n = " << dp.n << " Rs = " << dp.Rs << " Rsh = " << dp.Rsh
				<< " (score " << cr.scoreBefore << ")\n";
	}
	else
		std::cerr << "Warning: condition is not near STC, calibration skipped\n";

	OneDiodeModel odm(ms, dp, filePtr->getResolution(), opt);
	IVCurve curve = odm.computeCurve(cond.G, cond.Tc);

	CurveAnalyzer analyzer(ms, opt);
	CurveIndicators ind = analyzer.analyze(curve);
	analyzer.dispRes(ind);
	if (!ind.allPassed())
		std::cerr << "Warning: some diagnostics failed, see [FAIL] above\n";

	CurveFamily family(odm);
	dispFamily("I-V at different irradiances (25 degC)", family.irradianceSweep());
	dispFamily("I-V at different temperatures (1000 W/m2)", family.temperatureSweep());

	if (argc > 2)
	{
		try {
			writeCsv(argv[2], curve);
		} catch (const std::runtime_error& e) {
			std::cerr << e.what() << std::endl;
			return 1;
		}
		std::cout << "\nCurve written to " << argv[2] << "\n";
	}
	return 0;
}
