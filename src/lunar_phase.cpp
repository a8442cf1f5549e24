#include "astro/lunar_phase.hpp"

#include<cmath>

#include "astro/angle.hpp"

const char*phase_name(PhaseName p){
	switch(p){
	case PhaseName::NEW:
		return "new";
	case PhaseName::WAXING_CRESCENT:
		return "waxing_crescent";
	case PhaseName::FIRST_QUARTER:
		return "first_quarter";
	case PhaseName::WAXING_GIBBOUS:
		return "waxing_gibbous";
	case PhaseName::FULL:
		return "full";
	case PhaseName::WANING_GIBBOUS:
		return "waning_gibbous";
	case PhaseName::LAST_QUARTER:
		return "last_quarter";
	case PhaseName::WANING_CRESCENT:
		return "waning_crescent";
	}
	return "?";
}

const char*phase_title(PhaseName p){
	switch(p){
	case PhaseName::NEW:
		return "New Moon";
	case PhaseName::WAXING_CRESCENT:
		return "Waxing Crescent";
	case PhaseName::FIRST_QUARTER:
		return "First Quarter";
	case PhaseName::WAXING_GIBBOUS:
		return "Waxing Gibbous";
	case PhaseName::FULL:
		return "Full Moon";
	case PhaseName::WANING_GIBBOUS:
		return "Waning Gibbous";
	case PhaseName::LAST_QUARTER:
		return "Last Quarter";
	case PhaseName::WANING_CRESCENT:
		return "Waning Crescent";
	}
	return "?";
}

PhaseName classify_phase(double angle){
	double a=norm_deg(angle);
	int idx=static_cast<int>(std::floor(a/45.0));
	if(idx<0){
		idx=0;
	}
	if(idx>7){
		idx=7;
	}
	return static_cast<PhaseName>(idx);
}

double phase_angle(double sun_lon,double moon_lon){
	return norm_deg(moon_lon-sun_lon);
}

double illum_pct(double angle){
	double a=norm_deg(angle);
	return (1.0-std::fabs(180.0-a)/180.0)*100.0;
}

LunarPhase calc_phase(double sun_lon,double moon_lon){
	LunarPhase lp;
	lp.angle=phase_angle(sun_lon,moon_lon);
	lp.name=classify_phase(lp.angle);
	lp.illum=illum_pct(lp.angle);
	return lp;
}
