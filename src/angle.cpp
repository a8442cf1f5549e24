#include "astro/angle.hpp"

#include<algorithm>
#include<cmath>

double norm_deg(double angle){
	double r=std::fmod(angle,360.0);
	if(r<0.0){
		r+=360.0;
	}
	// -1e-17+360 rounds to 360
	if(r>=360.0){
		r=0.0;
	}
	return r;
}

double ang_dist(double a,double b){
	double d=std::fabs(norm_deg(a)-norm_deg(b));
	return std::min(d,360.0-d);
}

OrbHit orb_match(double a,double b,double target,double orb){
	double actual=ang_dist(a,b);
	double delta=std::fabs(actual-target);
	if(target>0.0){
		delta=std::min(delta,std::fabs(actual-(360.0-target)));
	}
	OrbHit hit;
	hit.delta=delta;
	hit.within=(delta<=orb);
	return hit;
}
