#pragma once

#include "astro/math.hpp"

struct TimeScale{
	// TAI-UTC in whole seconds, 0 before 1972
	static int leap_sec(double jd_utc);

	// TT-UT in seconds for a fractional year, outside the leap-second era
	static double delta_t(double year);

	static double tt_minus_utc(double jd_utc);

	static double tdb_minus_tt(double jd_tt);

	static double utc_to_tt(double jd_utc);

	static double utc_to_tdb(double jd_utc);

	static double jd2year(double jd){ return 2000.0+(jd-2451544.5)/365.2425; }
};
