#ifndef TEST_H_INCLUDED
#define TEST_H_INCLUDED

#include <iostream>
#include "Utils/pvcommutils.h"

#define PRECISION 0.0001

#define EXPECTMATRIX_EQ( arg1_, arg2_ ) (((arg1_)-(arg2_)).norm() < PRECISION)
#define EXPECTNUM_EQ( arg1_, arg2_ ) (ABS((arg1_) - (arg2_)) < PRECISION)
#define EXPECTNUM_NEAR( arg1_, arg2_, tol_ ) (ABS((arg1_) - (arg2_)) <= (tol_))
#define EXPECTREL_NEAR( arg1_, ref_, rel_ ) (ABS((arg1_) - (ref_)) <= (rel_)*ABS(ref_))

/// Print the outcome of one test case and count the failures.
#define REPORT( res_, failures_ ) \
do { \
	if (res_) \
		std::cout<<"Testing: success finished\n"; \
	else { \
		std::cout<<"Testing: failed finished\n"; \
		++(failures_); } } while(false)

#endif
