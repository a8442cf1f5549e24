#pragma once

#include<utility>

#include "astro/math.hpp"

enum class PrecModel{ AUTO,IAU2006,VONDRAK };

// years from J2000 beyond which AUTO switches to the long-term model
extern const double LONG_THR;

struct CoordTf{
	static Mat3 R1(double angle);

	static Mat3 bias_mat();
};

struct PrecNut{
	// GCRS to mean equator and equinox of date, frame bias included
	static Mat3 prec_mat(double jd_tdb,PrecModel model=PrecModel::AUTO);

	static double mean_obl(double jd_tdb);

	static std::pair<double,double> nut_ang(double jd_tdb);

	static Mat3 nut_mat(double jd_tdb);

	static double true_obl(double jd_tdb);

	// GCRS to true ecliptic and equinox of date
	static Mat3 ecl_mat(double jd_tdb,PrecModel model=PrecModel::AUTO);
};
