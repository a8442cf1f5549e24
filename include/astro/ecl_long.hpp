#pragma once

#include<utility>

#include "astro/frames.hpp"
#include "astro/spc_ephem.hpp"

struct RetProp{
	Vec3 X;
	Vec3 V;
	double tr;
};

struct AberCorr{
	static double lightday(const Vec3&vec){ return vec.norm()/C_AUDAY; }

	// Geocentric J2000 state of target, retarded by light time
	static RetProp geo_prop(SpkKernel&kern,int target,double jd_tdb,
							int max_iter=3);

	// Stellar aberration for an observer moving with vel_obs (au/day)
	static Vec3 aberrate(const Vec3&X,const Vec3&vel_obs);
};

// Apparent geocentric longitude on the true ecliptic of date.
class EclLong{
  public:
	explicit EclLong(SpkKernel&kern,PrecModel model=PrecModel::AUTO);

	Mat3 rot_mat(double jd_tdb);

	// {lambda rad in [0,2pi), dlambda/dt rad/day}
	std::pair<double,double> calc(int target,double jd_tdb);

  private:
	SpkKernel&kern_;
	PrecModel model_;
	bool rot_ok_;
	double rot_jd_;
	Mat3 rot_cache_;
};
