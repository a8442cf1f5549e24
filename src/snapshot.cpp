#include "astro/snapshot.hpp"

#include<cmath>
#include<iomanip>
#include<ostream>
#include<set>
#include<sstream>
#include<stdexcept>

#include "astro/errors.hpp"
#include "astro/format.hpp"
#include "astro/math.hpp"

const char*status_name(SnapStatus s){
	return s==SnapStatus::COMPLETE?"complete":"partial";
}

const BodyPosition*DailySnapshot::position(Body b) const{
	for(const auto&p : positions){
		if(p.body==b){
			return &p;
		}
	}
	return nullptr;
}

std::vector<AspectRecord> DailySnapshot::aspects_for(Body b) const{
	std::vector<AspectRecord> out;
	for(const auto&a : aspects){
		if(a.involves(b)){
			out.push_back(a);
		}
	}
	return out;
}

const AspectRecord*DailySnapshot::aspect_between(Body a,Body b) const{
	for(const auto&r : aspects){
		if((r.body_a==a&&r.body_b==b)||(r.body_a==b&&r.body_b==a)){
			return &r;
		}
	}
	return nullptr;
}

bool DailySnapshot::has_conj(Body a,Body b,double max_orb) const{
	const AspectRecord*r=aspect_between(a,b);
	return r&&r->type==AspectType::CONJUNCTION&&r->delta<=max_orb;
}

SnapCfg::SnapCfg()
	: bodies(all_bodies().begin(),all_bodies().end()),
	  jd_min(greg2jd(1550,1,1)),jd_max(greg2jd(2650,1,1)){}

void SnapCfg::validate() const{
	aspect.validate();
	score.validate();
	if(bodies.empty()){
		throw ConfigError("no bodies tracked");
	}
	std::set<Body> seen;
	for(Body b : bodies){
		if(!seen.insert(b).second){
			throw ConfigError(std::string("body listed twice: ")+body_name(b));
		}
	}
	if(!std::isfinite(jd_min)||!std::isfinite(jd_max)||jd_min>=jd_max){
		throw ConfigError("supported JD range is empty");
	}
}

SnapAsm::SnapAsm(EphemProvider&eph,const SnapCfg&cfg) : eph_(eph),cfg_(cfg){
	cfg_.validate();
}

void SnapAsm::chk_instant(double jd_utc) const{
	if(!std::isfinite(jd_utc)){
		throw InvalidInstant("julian day is not finite");
	}
	if(jd_utc<cfg_.jd_min||jd_utc>cfg_.jd_max){
		std::ostringstream oss;
		oss<<std::fixed<<std::setprecision(5)<<"JD "<<jd_utc
		   <<" outside supported range ["<<cfg_.jd_min<<", "<<cfg_.jd_max<<"]";
		throw InvalidInstant(oss.str());
	}
}

DailySnapshot SnapAsm::build(double jd_utc,std::ostream*log) const{
	chk_instant(jd_utc);

	DailySnapshot s;
	s.jd_utc=jd_utc;
	s.utc_iso=fmt_iso(jd_utc,0,false);
	s.date=fmt_date(jd_utc,0);

	for(Body b : cfg_.bodies){
		try{
			BodyState st=eph_.state(jd_utc,b);
			if(!std::isfinite(st.longitude)||!std::isfinite(st.speed)){
				throw BodyUnavailable(b,"provider returned a non-finite state");
			}
			s.positions.push_back(mk_pos(b,st.longitude,st.speed));
		}catch(const BodyUnavailable&ex){
			BodyFail f;
			f.body=b;
			f.reason=ex.what();
			s.failures.push_back(f);
			if(log){
				(*log)<<"[warn] "<<s.date<<" "<<ex.what()<<std::endl;
			}
		}
	}
	s.status=s.failures.empty()?SnapStatus::COMPLETE:SnapStatus::PARTIAL;

	if(!s.insufficient()){
		s.aspects=detect_aspects(s.positions,cfg_.aspect);
		apply_dir(s.aspects,s.positions);
	}else if(log){
		(*log)<<"[warn] "<<s.date<<" insufficient data: "<<s.positions.size()
			  <<" body position(s)"<<std::endl;
	}

	const BodyPosition*sun=s.position(Body::SUN);
	const BodyPosition*moon=s.position(Body::MOON);
	if(sun&&moon){
		s.phase=calc_phase(sun->longitude,moon->longitude);
		s.phase_ok=true;
	}

	ScoreResult sr=score_day(s.aspects,s.phase_ok?&s.phase:nullptr,cfg_.score);
	s.score=sr.score;
	s.outlook=sr.outlook;
	s.events=sr.events;
	return s;
}

DailySnapshot SnapAsm::build_iso(const std::string&text,
								 const std::string&default_tz,
								 std::ostream*log) const{
	return build(to_instant(text,default_tz),log);
}

double to_instant(const std::string&text,const std::string&default_tz){
	try{
		return parse_iso(text,default_tz).jd_utc;
	}catch(const std::invalid_argument&ex){
		throw InvalidInstant(ex.what());
	}
}
