#include "astro/body.hpp"

#include<cctype>
#include<cmath>
#include<stdexcept>

#include "astro/angle.hpp"

namespace{

std::string low(std::string s){
	for(char&c : s){
		c=static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return s;
}

std::string strip(const std::string&s){
	std::size_t a=0;
	while(a<s.size()&&std::isspace(static_cast<unsigned char>(s[a]))){
		++a;
	}
	std::size_t b=s.size();
	while(b>a&&std::isspace(static_cast<unsigned char>(s[b-1]))){
		--b;
	}
	return s.substr(a,b-a);
}

}

const std::array<Body,BODY_COUNT>&all_bodies(){
	static const std::array<Body,BODY_COUNT> kAll={{
		Body::SUN,
		Body::MOON,
		Body::MERCURY,
		Body::VENUS,
		Body::MARS,
		Body::JUPITER,
		Body::SATURN,
		Body::URANUS,
		Body::NEPTUNE,
		Body::PLUTO,
	}};
	return kAll;
}

const char*body_name(Body b){
	switch(b){
	case Body::SUN:
		return "Sun";
	case Body::MOON:
		return "Moon";
	case Body::MERCURY:
		return "Mercury";
	case Body::VENUS:
		return "Venus";
	case Body::MARS:
		return "Mars";
	case Body::JUPITER:
		return "Jupiter";
	case Body::SATURN:
		return "Saturn";
	case Body::URANUS:
		return "Uranus";
	case Body::NEPTUNE:
		return "Neptune";
	case Body::PLUTO:
		return "Pluto";
	}
	return "?";
}

Body parse_body(const std::string&name){
	std::string key=low(strip(name));
	for(Body b : all_bodies()){
		if(low(body_name(b))==key){
			return b;
		}
	}
	throw std::invalid_argument("unknown body: "+name);
}

std::vector<Body> parse_bodies(const std::string&csv){
	std::vector<Body> out;
	std::string cur;
	for(char c : csv){
		if(c==','){
			out.push_back(parse_body(cur));
			cur.clear();
		}else{
			cur.push_back(c);
		}
	}
	if(!strip(cur).empty()||!out.empty()){
		out.push_back(parse_body(cur));
	}
	return out;
}

const char*zodiac_name(Zodiac z){
	static const char*const kNames[]={
		"aries","taurus","gemini",	   "cancer",	"leo",		"virgo",
		"libra","scorpio","sagittarius","capricorn","aquarius","pisces",
	};
	return kNames[static_cast<int>(z)];
}

const char*placement_name(Placement p){
	switch(p){
	case Placement::EARLY:
		return "early";
	case Placement::MIDDLE:
		return "middle";
	case Placement::LATE:
		return "late";
	}
	return "?";
}

int body_rank(Body b){ return static_cast<int>(b); }

Zodiac sign_of(double longitude){
	int idx=static_cast<int>(std::floor(norm_deg(longitude)/30.0));
	if(idx>11){
		idx=11;
	}
	return static_cast<Zodiac>(idx);
}

double deg_in_sign(double longitude){
	double lon=norm_deg(longitude);
	double d=lon-30.0*static_cast<int>(sign_of(lon));
	return d<0.0?0.0:d;
}

Placement placement_of(double deg){
	if(deg<10.0){
		return Placement::EARLY;
	}
	if(deg<20.0){
		return Placement::MIDDLE;
	}
	return Placement::LATE;
}

BodyPosition mk_pos(Body body,double longitude,double speed){
	BodyPosition p;
	p.body=body;
	p.longitude=norm_deg(longitude);
	p.speed=speed;
	p.sign=sign_of(p.longitude);
	p.deg_in_sign=deg_in_sign(p.longitude);
	p.placement=placement_of(p.deg_in_sign);
	return p;
}
