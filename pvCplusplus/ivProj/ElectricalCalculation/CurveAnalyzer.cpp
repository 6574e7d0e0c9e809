#include "CurveAnalyzer.h"
#include "../ModuleDefinition/OneDiodeModel.h"
#include <sstream>
#include <iomanip>
#include <boost/math/special_functions/fpclassify.hpp>

bool CurveIndicators::allPassed() const
{
	return std::all_of(diagnostics.cbegin(), diagnostics.cend(),
		[](const Diagnostic& d) { return d.passed; });
}

const Diagnostic* CurveIndicators::find(const std::string& name) const
{
	for (const Diagnostic& d : diagnostics)
		if (d.name == name)
			return &d;
	return nullptr;
}

MppInfo CurveAnalyzer::getMpp(const IVCurve& c)
{
	MppInfo mpp;
	int size = c.getSize();
	if (size == 0)
	{
		mpp.index = -1;
		return mpp;
	}

	/// Strict comparison keeps the first maximum.
	int best = 0;
	for (int i = 1; i < size; i++)
		if (c.P(i) > c.P(best))
			best = i;

	mpp.index = best;
	mpp.vmp = c.V(best);
	mpp.imp = c.I(best);
	mpp.pmp = c.P(best);
	return mpp;
}

Diagnostic CurveAnalyzer::checkShortCircuit(const IVCurve& c, const CurveIndicators& r) const
{
	double tol = pvMAX(ISCTOLABS, ISCTOLREL*ABS(r.isc));
	double err = ABS(c.I(0) - r.isc);

	std::ostringstream msg;
	msg << "I(V=0) = " << c.I(0) << " A vs Isc' = " << r.isc << " A (|diff| " << err << ", tol " << tol << ")";
	return { "shortCircuit", err <= tol, msg.str() };
}

Diagnostic CurveAnalyzer::checkOpenCircuit(const IVCurve& c, const CurveIndicators& r) const
{
	int last = c.getSize() - 1;
	double tol = pvMAX(VOCTOLABS, VOCTOLREL*ABS(r.isc));
	double err = ABS(c.I(last));

	std::ostringstream msg;
	msg << "I(V=" << c.V(last) << ") = " << c.I(last) << " A, expected ~0 (tol " << tol << ")";
	return { "openCircuit", err <= tol, msg.str() };
}

Diagnostic CurveAnalyzer::checkMonotonicity(const IVCurve& c) const
{
	int size = c.getSize();
	for (int i = 0; i + 1 < size; i++)
	{
		if (c.I(i + 1) > c.I(i) + MONOTOL)
		{
			std::ostringstream msg;
			msg << "current rises from " << c.I(i) << " A to " << c.I(i + 1)
				<< " A between V = " << c.V(i) << " and " << c.V(i + 1) << " V";
			return { "monotonicity", false, msg.str() };
		}
	}
	return { "monotonicity", true, "current is non-increasing along the curve" };
}

Diagnostic CurveAnalyzer::checkMppInside(const CurveIndicators& r) const
{
	bool inside = (r.mpp.vmp > 0.0) && (r.mpp.vmp < r.voc) && (r.mpp.imp > 0.0) && (r.mpp.imp < r.isc);

	std::ostringstream msg;
	msg << "MPP (" << r.mpp.vmp << " V, " << r.mpp.imp << " A) "
		<< (inside ? "inside" : "outside") << " (0, " << r.voc << ") x (0, " << r.isc << ")";
	return { "mppInside", inside, msg.str() };
}

Diagnostic CurveAnalyzer::checkMppVoltageRef(const CurveIndicators& r) const
{
	double rel = ABS(r.mpp.vmp - moduleSpec.vmppRef)/moduleSpec.vmppRef;

	std::ostringstream msg;
	msg << "Vmp = " << r.mpp.vmp << " V vs nameplate " << moduleSpec.vmppRef << " V ("
		<< std::setprecision(3) << rel*100.0 << " %)";
	return { "mppVoltageRef", rel <= MPPREFREL, msg.str() };
}

Diagnostic CurveAnalyzer::checkMppCurrentRef(const CurveIndicators& r) const
{
	double rel = ABS(r.mpp.imp - moduleSpec.imppRef)/moduleSpec.imppRef;

	std::ostringstream msg;
	msg << "Imp = " << r.mpp.imp << " A vs nameplate " << moduleSpec.imppRef << " A ("
		<< std::setprecision(3) << rel*100.0 << " %)";
	return { "mppCurrentRef", rel <= MPPREFREL, msg.str() };
}

Diagnostic CurveAnalyzer::checkConvergence(const IVCurve& c) const
{
	int notConverged = c.countStatus(NrStatus::maxIterReached);
	int reset = c.countStatus(NrStatus::nonFinite);

	std::ostringstream msg;
	if (notConverged == 0 && reset == 0)
		msg << "Newton iteration converged at all " << c.getSize() << " points";
	else
		msg << notConverged << " point(s) hit the " << solverOpt.MaxIter
			<< "-iteration cap, " << reset << " point(s) reset after a non-finite step";
	return { "convergence", notConverged == 0 && reset == 0, msg.str() };
}

Diagnostic CurveAnalyzer::checkExplicitAgreement(const IVCurve& c, const CurveIndicators& r) const
{
	const struct Params& p = c.params;
	double arg = (r.mpp.vmp + r.mpp.imp*p.Rs)/pvMAX(p.nVth, NVTFLOOR);

	if (c.status.rows() != c.getSize() || c.status(r.mpp.index) != NrStatus::converged)
		return { "explicitAgreement", true, "skipped, no converged root at the MPP" };
	if (ABS(arg) > solverOpt.ExpArgLim)
		return { "explicitAgreement", true, "skipped, exponent clamp active at the MPP" };

	double iRef = OneDiodeModel::explicitCurrent(p, r.mpp.vmp);
	if (!boost::math::isfinite(iRef))
		return { "explicitAgreement", true, "skipped, explicit solution not finite" };

	double tol = pvMAX(AGREETOLABS, AGREETOLREL*ABS(c.IL));
	double err = ABS(r.mpp.imp - iRef);

	std::ostringstream msg;
	msg << "Newton I = " << r.mpp.imp << " A vs Lambert-W I = " << iRef << " A at V = " << r.mpp.vmp
		<< " V (|diff| " << err << ", tol " << tol << ")";
	return { "explicitAgreement", err <= tol, msg.str() };
}

CurveIndicators CurveAnalyzer::analyze(const IVCurve& c) const
{
	CurveIndicators r;
	r.isc = c.IL;
	r.voc = c.VocG;
	r.mpp = getMpp(c);

	if (r.mpp.index < 0)
	{
		r.diagnostics.push_back({ "shortCircuit", false, "empty curve" });
		return r;
	}

	r.fillFactor = r.mpp.pmp/pvMAX(r.voc*r.isc, FFFLOOR);
	double pin = c.G*moduleSpec.area;
	r.efficiency = (pin > 0.0) ? r.mpp.pmp/pin : 0.0;

	r.diagnostics.push_back(checkShortCircuit(c, r));
	r.diagnostics.push_back(checkOpenCircuit(c, r));
	r.diagnostics.push_back(checkMonotonicity(c));
	r.diagnostics.push_back(checkMppInside(r));
	if (isNearSTC({ c.G, c.Tc }))
	{
		r.diagnostics.push_back(checkMppVoltageRef(r));
		r.diagnostics.push_back(checkMppCurrentRef(r));
	}
	r.diagnostics.push_back(checkConvergence(c));
	r.diagnostics.push_back(checkExplicitAgreement(c, r));

#ifndef NDEBUG
	dispRes(r);
#endif
	return r;
}

void CurveAnalyzer::dispRes(const CurveIndicators& r, std::ostream& os) const
{
	os << "Pmp is " << r.mpp.pmp << " Vmp is " << r.mpp.vmp << " Imp is " << r.mpp.imp
		<< " Voc is " << r.voc << " Isc is " << r.isc
		<< " FF is " << r.fillFactor << " Eff is " << r.efficiency << "\n";
	for (const Diagnostic& d : r.diagnostics)
		os << (d.passed ? "  [pass] " : "  [FAIL] ") << d.name << ": " << d.message << "\n";
}
