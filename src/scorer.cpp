#include "astro/scorer.hpp"

#include<algorithm>
#include<cmath>
#include<set>

#include "astro/errors.hpp"

const char*outlook_name(Outlook o){
	switch(o){
	case Outlook::BULLISH:
		return "bullish";
	case Outlook::BEARISH:
		return "bearish";
	case Outlook::NEUTRAL:
		return "neutral";
	case Outlook::VOLATILE:
		return "volatile";
	}
	return "?";
}

void ScoreCfg::validate() const{
	if(!std::isfinite(base)||base<0.0||base>100.0){
		throw ConfigError("base must be within [0,100]");
	}
	for(AspectType t : all_aspects()){
		if(!std::isfinite(weight(t))){
			throw ConfigError(std::string("weight for ")+aspect_name(t)+
							  " is not a finite number");
		}
	}
	if(!std::isfinite(phase_bonus)||phase_bonus<0.0){
		throw ConfigError("phase_bonus must be a non-negative number");
	}
	if(!std::isfinite(notable_orb)||notable_orb<0.0){
		throw ConfigError("notable_orb must be a non-negative number");
	}
	if(!std::isfinite(bullish_at)||!std::isfinite(bearish_at)||
	   bearish_at<0.0||bullish_at>100.0||bearish_at>=bullish_at){
		throw ConfigError("thresholds must satisfy 0 <= bearish_at < bullish_at "
						  "<= 100");
	}
}

Outlook pick_outlook(double score,bool volatile_flag,const ScoreCfg&cfg){
	if(score>=cfg.bullish_at){
		return Outlook::BULLISH;
	}
	if(score<=cfg.bearish_at){
		return Outlook::BEARISH;
	}
	return volatile_flag?Outlook::VOLATILE:Outlook::NEUTRAL;
}

std::vector<std::string> sig_events(const std::vector<AspectRecord>&aspects,
									const LunarPhase*phase,
									const ScoreCfg&cfg){
	std::vector<std::string> out;
	std::set<std::string> seen;
	auto add=[&](const std::string&ev){
		if(seen.insert(ev).second){
			out.push_back(ev);
		}
	};

	for(const auto&a : aspects){
		if(!a.within){
			continue;
		}
		if(a.exact||a.delta<cfg.notable_orb){
			add(aspect_label(a));
		}
	}
	if(phase&&(phase->is_full()||phase->is_new())){
		add(phase_title(phase->name));
	}
	return out;
}

ScoreResult score_day(const std::vector<AspectRecord>&aspects,
					  const LunarPhase*phase,const ScoreCfg&cfg){
	ScoreResult r;

	double adjust=0.0;
	for(const auto&a : aspects){
		if(!a.within||!cfg.is_major(a.type)){
			continue;
		}
		adjust+=cfg.weight(a.type)*a.exactness;
	}

	if(phase&&(phase->is_full()||phase->is_new())){
		r.volatile_flag=true;
		adjust+=(adjust<0.0)?-cfg.phase_bonus:cfg.phase_bonus;
	}

	r.adjust=adjust;
	r.score=std::min(100.0,std::max(0.0,cfg.base+adjust));
	r.outlook=pick_outlook(r.score,r.volatile_flag,cfg);
	r.events=sig_events(aspects,phase,cfg);
	return r;
}
