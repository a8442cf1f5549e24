#pragma once

#include<iosfwd>
#include<string>
#include<vector>

#include "astro/aspect.hpp"
#include "astro/body.hpp"
#include "astro/ephem.hpp"
#include "astro/lunar_phase.hpp"
#include "astro/scorer.hpp"

struct BodyFail{
	Body body=Body::SUN;
	std::string reason;
};

enum class SnapStatus{ COMPLETE,PARTIAL };

const char*status_name(SnapStatus s);

struct DailySnapshot{
	double jd_utc=0.0;
	std::string utc_iso;
	std::string date;

	std::vector<BodyPosition> positions;
	std::vector<BodyFail> failures;
	std::vector<AspectRecord> aspects;

	bool phase_ok=false;
	LunarPhase phase;

	std::vector<std::string> events;
	double score=50.0;
	Outlook outlook=Outlook::NEUTRAL;
	SnapStatus status=SnapStatus::COMPLETE;

	bool insufficient() const{ return positions.size()<2; }

	const BodyPosition*position(Body b) const;

	std::vector<AspectRecord> aspects_for(Body b) const;

	const AspectRecord*aspect_between(Body a,Body b) const;

	bool has_conj(Body a,Body b,double max_orb=8.0) const;
};

struct SnapCfg{
	AspectCfg aspect;
	ScoreCfg score;
	std::vector<Body> bodies;
	double jd_min;
	double jd_max;

	SnapCfg();

	// throws ConfigError
	void validate() const;
};

class SnapAsm{
  public:
	SnapAsm(EphemProvider&eph,const SnapCfg&cfg);

	const SnapCfg&cfg() const{ return cfg_; }

	// throws InvalidInstant for non-finite or out-of-range JDs
	void chk_instant(double jd_utc) const;

	DailySnapshot build(double jd_utc,std::ostream*log=nullptr) const;

	DailySnapshot build_iso(const std::string&text,
							const std::string&default_tz="Z",
							std::ostream*log=nullptr) const;

  private:
	EphemProvider&eph_;
	SnapCfg cfg_;
};

// ISO text to UTC JD, rethrowing parse errors as InvalidInstant
double to_instant(const std::string&text,const std::string&default_tz);
