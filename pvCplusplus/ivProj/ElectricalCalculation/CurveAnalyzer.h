/**
 * Reduction of an IVCurve to its indicators: MPP, fill factor and efficiency,
 * plus a set of advisory sanity checks.
 *
 * The diagnostics never halt anything; a failing check is only reported.
 */
#ifndef CURVEANALYZER_H_
#define CURVEANALYZER_H_

#include <iostream>
#include <string>
#include <vector>
#include "../Utils/pvcommutils.h"
#include "IVCurve.h"

constexpr double ISCTOLABS  = 0.5;
constexpr double ISCTOLREL  = 0.05;
constexpr double VOCTOLABS  = 0.3;
constexpr double VOCTOLREL  = 0.03;
constexpr double MONOTOL    = 1e-3;
constexpr double MPPREFREL  = 0.05;
constexpr double AGREETOLABS = 1e-3;
constexpr double AGREETOLREL = 1e-3;

struct Diagnostic
{
	std::string name;
	bool passed;
	std::string message;
};

struct MppInfo
{
	double vmp{ 0.0 };
	double imp{ 0.0 };
	double pmp{ 0.0 };
	int index{ 0 };
};

struct CurveIndicators
{
	MppInfo mpp;
	double isc{ 0.0 }; /// Isc'
	double voc{ 0.0 }; /// Voc'
	double fillFactor{ 0.0 };
	double efficiency{ 0.0 };
	std::vector<Diagnostic> diagnostics;

	bool allPassed() const;
	/// nullptr if no diagnostic carries that name.
	const Diagnostic* find(const std::string& name) const;
};

class CurveAnalyzer
{
private:
	ModuleSpec moduleSpec; /// Nameplate reference.
	SolverOpt  solverOpt;

	Diagnostic checkShortCircuit(const IVCurve& c, const CurveIndicators& r) const;
	Diagnostic checkOpenCircuit(const IVCurve& c, const CurveIndicators& r) const;
	Diagnostic checkMonotonicity(const IVCurve& c) const;
	Diagnostic checkMppInside(const CurveIndicators& r) const;
	Diagnostic checkMppVoltageRef(const CurveIndicators& r) const;
	Diagnostic checkMppCurrentRef(const CurveIndicators& r) const;
	Diagnostic checkConvergence(const IVCurve& c) const;
	Diagnostic checkExplicitAgreement(const IVCurve& c, const CurveIndicators& r) const;

public:
	explicit CurveAnalyzer(const ModuleSpec& moduleSpec_, const SolverOpt& solverOpt_ = SolverOpt())
	: moduleSpec(moduleSpec_), solverOpt(solverOpt_) {}

	/// Maximum power point, the first one on ties.
	static MppInfo getMpp(const IVCurve& c);

	/**
	 * Indicators of the curve against the nameplate reference.
	 *
	 * Isc' and Voc' are the IL and VocG carried by the curve. The checks against
	 * Vmpp/Impp are only added near STC (see isNearSTC).
	 */
	CurveIndicators analyze(const IVCurve& c) const;

	void dispRes(const CurveIndicators& r, std::ostream& os = std::cout) const;
};

#endif
