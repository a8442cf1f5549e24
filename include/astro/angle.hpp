#pragma once

// Angles here are in degrees.

struct OrbHit{
	bool within=false;
	double delta=0.0;
};

double norm_deg(double angle);

double ang_dist(double a,double b);

OrbHit orb_match(double a,double b,double target,double orb);
