/**
 * Benchmark on solving many operating conditions in parallel.
 */
#include "../../testUtils.h"
#include "../CurveFamily.h"
#include <omp.h>
#include <iostream>

/// The number of conditions
constexpr int ITRNUM = 2000;

int main()
{
	OneDiodeModel odm(elg590Module(), elg590Diode());
	CurveFamily family(odm);

	std::vector<Condition> conds;
	for (int i = 0; i < ITRNUM; i++)
		conds.push_back({ 50.0 + 1150.0*i/ITRNUM, -10.0 + 85.0*(i % 100)/100.0 });

	double start, end;

	std::cout<<"\nBenchmarking: CurveFamily::sweep on "<<omp_get_max_threads()<<" threads\n";
	TIMESTAMP( start );
	std::vector<IVCurve> curves = family.sweep(conds);
	TIMESTAMP( end );
	std::cout<<"The elapsed time is "<<end - start<<" s\n";

	std::cout<<"\nBenchmarking: serial computeCurve\n";
	TIMESTAMP( start );
	for (const Condition& c : conds)
		odm.computeCurve(c.G, c.Tc);
	TIMESTAMP( end );
	std::cout<<"The elapsed time is "<<end - start<<" s\n";
}
