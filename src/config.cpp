#include "astro/config.hpp"

#include<cctype>
#include<cmath>
#include<fstream>
#include<iomanip>
#include<istream>
#include<ostream>
#include<stdexcept>

#include "astro/errors.hpp"
#include "astro/format.hpp"

const std::string CFG_FILE="astro_cfg.txt";

namespace{

double num_val(const std::string&key,const std::string&text){
	std::size_t pos=0;
	double v=0.0;
	try{
		v=std::stod(text,&pos);
	}catch(const std::exception&){
		throw ConfigError("invalid number for "+key+": "+text);
	}
	if(pos!=text.size()||!std::isfinite(v)){
		throw ConfigError("invalid number for "+key+": "+text);
	}
	return v;
}

int int_val(const std::string&key,const std::string&text){
	double v=num_val(key,text);
	if(v!=std::floor(v)||std::fabs(v)>1e6){
		throw ConfigError("invalid integer for "+key+": "+text);
	}
	return static_cast<int>(v);
}

bool bool_val(const std::string&key,const std::string&text){
	if(text=="1"||text=="true"||text=="yes"){
		return true;
	}
	if(text=="0"||text=="false"||text=="no"){
		return false;
	}
	throw ConfigError(key+" must be 0 or 1: "+text);
}

AspectType aspect_val(const std::string&key,const std::string&name){
	try{
		return parse_aspect(name);
	}catch(const std::invalid_argument&){
		throw ConfigError("unknown aspect in "+key+": "+name);
	}
}

std::string join_major(const ScoreCfg&sc){
	std::string out;
	for(AspectType t : all_aspects()){
		if(sc.is_major(t)){
			if(!out.empty()){
				out+=",";
			}
			out+=aspect_name(t);
		}
	}
	return out;
}

std::string join_bodies(const std::vector<Body>&bodies){
	std::string out;
	for(Body b : bodies){
		if(!out.empty()){
			out+=",";
		}
		out+=body_name(b);
	}
	return out;
}

}

std::string trim(const std::string&s){
	std::size_t start=0;
	while(start<s.size()&&std::isspace(static_cast<unsigned char>(s[start]))){
		++start;
	}
	std::size_t end=s.size();
	while(end>start&&std::isspace(static_cast<unsigned char>(s[end-1]))){
		--end;
	}
	return s.substr(start,end-start);
}

void apply_kv(EngineCfg&cfg,const std::string&key,const std::string&value){
	SnapCfg&sc=cfg.snap;
	if(key=="bsp"){
		cfg.bsp=value;
	}else if(key=="table"){
		cfg.table=value;
	}else if(key=="tz"){
		try{
			parse_tz(value);
		}catch(const std::invalid_argument&ex){
			throw ConfigError(ex.what());
		}
		cfg.tz=value;
	}else if(key=="format"){
		if(value!="txt"&&value!="json"){
			throw ConfigError("format must be txt or json: "+value);
		}
		cfg.def_fmt=value;
	}else if(key=="pretty"){
		cfg.pretty=bool_val(key,value);
	}else if(key=="jobs"){
		cfg.jobs=int_val(key,value);
		if(cfg.jobs<1||cfg.jobs>64){
			throw ConfigError("jobs must be within [1,64]");
		}
	}else if(key=="bodies"){
		try{
			sc.bodies=parse_bodies(value);
		}catch(const std::invalid_argument&ex){
			throw ConfigError(ex.what());
		}
	}else if(key=="jd_min"){
		sc.jd_min=num_val(key,value);
	}else if(key=="jd_max"){
		sc.jd_max=num_val(key,value);
	}else if(key=="exact_eps"){
		sc.aspect.exact_eps=num_val(key,value);
	}else if(key.compare(0,4,"orb.")==0){
		sc.aspect.set_orb(aspect_val(key,key.substr(4)),num_val(key,value));
	}else if(key.compare(0,7,"weight.")==0){
		AspectType t=aspect_val(key,key.substr(7));
		sc.score.weights[static_cast<std::size_t>(t)]=num_val(key,value);
	}else if(key=="major"){
		std::array<bool,ASPECT_COUNT> major{};
		std::string cur;
		std::string list=value+",";
		for(char c : list){
			if(c!=','){
				cur.push_back(c);
				continue;
			}
			std::string name=trim(cur);
			cur.clear();
			if(name.empty()){
				continue;
			}
			major[static_cast<std::size_t>(aspect_val(key,name))]=true;
		}
		sc.score.major=major;
	}else if(key=="base"){
		sc.score.base=num_val(key,value);
	}else if(key=="phase_bonus"){
		sc.score.phase_bonus=num_val(key,value);
	}else if(key=="notable_orb"){
		sc.score.notable_orb=num_val(key,value);
	}else if(key=="bullish_at"){
		sc.score.bullish_at=num_val(key,value);
	}else if(key=="bearish_at"){
		sc.score.bearish_at=num_val(key,value);
	}else{
		throw ConfigError("unknown key: "+key);
	}
}

void parse_cfg(std::istream&is,const std::string&src,EngineCfg&cfg){
	std::string line;
	int line_no=0;
	while(std::getline(is,line)){
		++line_no;
		std::string t=trim(line);
		if(t.empty()||t[0]=='#'){
			continue;
		}
		auto pos=t.find('=');
		if(pos==std::string::npos){
			throw ConfigError(src+":"+std::to_string(line_no)+
							  ": expected key=value");
		}
		try{
			apply_kv(cfg,trim(t.substr(0,pos)),trim(t.substr(pos+1)));
		}catch(const ConfigError&ex){
			throw ConfigError(src+":"+std::to_string(line_no)+": "+ex.what());
		}
	}
	cfg.snap.validate();
}

bool load_cfg(const std::string&path,EngineCfg&cfg){
	std::ifstream ifs(path);
	if(!ifs){
		return false;
	}
	parse_cfg(ifs,path,cfg);
	return true;
}

bool save_cfg(const std::string&path,const EngineCfg&cfg){
	std::ofstream ofs(path);
	if(!ofs){
		return false;
	}
	dump_cfg(ofs,cfg);
	return static_cast<bool>(ofs);
}

void dump_cfg(std::ostream&os,const EngineCfg&cfg){
	const SnapCfg&sc=cfg.snap;
	os<<std::setprecision(17);
	os<<"bsp="<<cfg.bsp<<"\n";
	os<<"table="<<cfg.table<<"\n";
	os<<"tz="<<cfg.tz<<"\n";
	os<<"format="<<cfg.def_fmt<<"\n";
	os<<"pretty="<<(cfg.pretty?"1":"0")<<"\n";
	os<<"jobs="<<cfg.jobs<<"\n";
	os<<"bodies="<<join_bodies(sc.bodies)<<"\n";
	os<<"jd_min="<<sc.jd_min<<"\n";
	os<<"jd_max="<<sc.jd_max<<"\n";
	os<<"exact_eps="<<sc.aspect.exact_eps<<"\n";
	for(AspectType t : all_aspects()){
		os<<"orb."<<aspect_name(t)<<"="<<sc.aspect.orb(t)<<"\n";
	}
	for(AspectType t : all_aspects()){
		os<<"weight."<<aspect_name(t)<<"="<<sc.score.weight(t)<<"\n";
	}
	os<<"major="<<join_major(sc.score)<<"\n";
	os<<"base="<<sc.score.base<<"\n";
	os<<"phase_bonus="<<sc.score.phase_bonus<<"\n";
	os<<"notable_orb="<<sc.score.notable_orb<<"\n";
	os<<"bullish_at="<<sc.score.bullish_at<<"\n";
	os<<"bearish_at="<<sc.score.bearish_at<<"\n";
	os<<std::setprecision(6);
}
