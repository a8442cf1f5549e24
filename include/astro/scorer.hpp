#pragma once

#include<array>
#include<string>
#include<vector>

#include "astro/aspect.hpp"
#include "astro/lunar_phase.hpp"

enum class Outlook{ BULLISH,BEARISH,NEUTRAL,VOLATILE };

const char*outlook_name(Outlook o);

struct ScoreCfg{
	double base=50.0;
	// signed: harmonious aspects lift the score, hard aspects lower it
	std::array<double,ASPECT_COUNT> weights={{6.0,4.0,-6.0,6.0,-8.0}};
	std::array<bool,ASPECT_COUNT> major={{true,false,true,false,true}};
	double phase_bonus=5.0;
	double notable_orb=1.0;
	double bullish_at=65.0;
	double bearish_at=35.0;

	double weight(AspectType t) const{
		return weights[static_cast<std::size_t>(t)];
	}
	bool is_major(AspectType t) const{
		return major[static_cast<std::size_t>(t)];
	}

	// throws ConfigError
	void validate() const;
};

struct ScoreResult{
	double adjust=0.0;
	bool volatile_flag=false;
	double score=50.0;
	Outlook outlook=Outlook::NEUTRAL;
	std::vector<std::string> events;
};

Outlook pick_outlook(double score,bool volatile_flag,const ScoreCfg&cfg);

std::vector<std::string> sig_events(const std::vector<AspectRecord>&aspects,
									const LunarPhase*phase,
									const ScoreCfg&cfg);

// phase may be null when Sun or Moon is missing
ScoreResult score_day(const std::vector<AspectRecord>&aspects,
					  const LunarPhase*phase,const ScoreCfg&cfg);
