#pragma once

enum class PhaseName{
	NEW,
	WAXING_CRESCENT,
	FIRST_QUARTER,
	WAXING_GIBBOUS,
	FULL,
	WANING_GIBBOUS,
	LAST_QUARTER,
	WANING_CRESCENT
};

struct LunarPhase{
	double angle=0.0;
	PhaseName name=PhaseName::NEW;
	double illum=0.0;

	bool is_new() const{ return name==PhaseName::NEW; }
	bool is_full() const{ return name==PhaseName::FULL; }
};

const char*phase_name(PhaseName p);

// "Full Moon" / "New Moon" style label used in event lists
const char*phase_title(PhaseName p);

// [0,45) new, [45,90) waxing_crescent, ... [315,360) waning_crescent
PhaseName classify_phase(double angle);

double phase_angle(double sun_lon,double moon_lon);

double illum_pct(double angle);

LunarPhase calc_phase(double sun_lon,double moon_lon);
