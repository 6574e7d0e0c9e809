/**
 * Sampled I-V / P-V curve of a module at one operating condition.
 *
 * pointSet holds one row per sample with the columns (V, I, P), V ascending from 0.
 */
#ifndef IVCURVE_H_
#define IVCURVE_H_

#include <Eigen/Dense>
#include "../Utils/pvcommutils.h"
#include "../Utils/Rootfind.h"

using namespace Eigen;

enum PSCol
{
	colV = 0,
	colI,
	colP,
	colNum
};

struct IVCurve
{
	MatrixXd pointSet; /// (V, I, P) per row.
	ArrayXi  status;   /// NrStatus of each row.

	double G{ 0.0 };
	double Tc{ 0.0 };
	double IL{ 0.0 };   /// Light-generated current, Isc'.
	double VocG{ 0.0 }; /// Condition-adjusted Voc'.
	struct Params params{}; /// Five parameters the curve was solved with.

	int getSize() const { return static_cast<int>(pointSet.rows()); }
	double V(int i) const { return pointSet(i, colV); }
	double I(int i) const { return pointSet(i, colI); }
	double P(int i) const { return pointSet(i, colP); }

	/// Number of rows with the given solver outcome.
	int countStatus(NrStatus st) const { return static_cast<int>((status == static_cast<int>(st)).count()); }
};

#endif
