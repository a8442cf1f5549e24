#include "astro/direction.hpp"

#include<cmath>

#include "astro/angle.hpp"

const char*dir_name(Direction d){
	switch(d){
	case Direction::APPLYING:
		return "applying";
	case Direction::SEPARATING:
		return "separating";
	case Direction::STATIONARY:
		return "stationary";
	}
	return "?";
}

Direction classify_dir(double lon_a,double spd_a,double lon_b,double spd_b,
					   double aspect_angle,double eps){
	double rel=spd_a-spd_b;
	if(std::fabs(rel)<eps){
		return Direction::STATIONARY;
	}

	double sep_now=ang_dist(lon_a,lon_b);
	double sep_next=ang_dist(lon_a+spd_a,lon_b+spd_b);

	double dist_now=std::fabs(sep_now-aspect_angle);
	double dist_next=std::fabs(sep_next-aspect_angle);

	if(dist_next<dist_now){
		return Direction::APPLYING;
	}
	if(dist_next>dist_now){
		return Direction::SEPARATING;
	}
	return Direction::STATIONARY;
}
