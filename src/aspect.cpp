#include "astro/aspect.hpp"

#include<cctype>
#include<cmath>
#include<stdexcept>
#include<utility>

#include "astro/angle.hpp"
#include "astro/errors.hpp"

namespace{

constexpr double kMaxOrb=30.0;

const BodyPosition*find_pos(const std::vector<BodyPosition>&pos,Body b){
	for(const auto&p : pos){
		if(p.body==b){
			return &p;
		}
	}
	return nullptr;
}

}

const std::array<AspectType,ASPECT_COUNT>&all_aspects(){
	static const std::array<AspectType,ASPECT_COUNT> kAll={{
		AspectType::CONJUNCTION,
		AspectType::SEXTILE,
		AspectType::SQUARE,
		AspectType::TRINE,
		AspectType::OPPOSITION,
	}};
	return kAll;
}

const char*aspect_name(AspectType t){
	switch(t){
	case AspectType::CONJUNCTION:
		return "conjunction";
	case AspectType::SEXTILE:
		return "sextile";
	case AspectType::SQUARE:
		return "square";
	case AspectType::TRINE:
		return "trine";
	case AspectType::OPPOSITION:
		return "opposition";
	}
	return "?";
}

AspectType parse_aspect(const std::string&name){
	std::string key=name;
	for(char&c : key){
		c=static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	for(AspectType t : all_aspects()){
		if(key==aspect_name(t)){
			return t;
		}
	}
	throw std::invalid_argument("unknown aspect: "+name);
}

double aspect_angle(AspectType t){
	switch(t){
	case AspectType::CONJUNCTION:
		return 0.0;
	case AspectType::SEXTILE:
		return 60.0;
	case AspectType::SQUARE:
		return 90.0;
	case AspectType::TRINE:
		return 120.0;
	case AspectType::OPPOSITION:
		return 180.0;
	}
	return 0.0;
}

void AspectCfg::validate() const{
	for(AspectType t : all_aspects()){
		double v=orb(t);
		if(!std::isfinite(v)||v<0.0||v>kMaxOrb){
			throw ConfigError(std::string("orb for ")+aspect_name(t)+
							  " must be within [0,30]");
		}
	}
	if(!std::isfinite(exact_eps)||exact_eps<0.0){
		throw ConfigError("exact_eps must be a non-negative number");
	}
}

std::vector<AspectRecord> detect_aspects(const std::vector<BodyPosition>&pos,
										 const AspectCfg&cfg){
	std::vector<AspectRecord> out;
	for(std::size_t i=0;i<pos.size();++i){
		for(std::size_t j=i+1;j<pos.size();++j){
			const BodyPosition*a=&pos[i];
			const BodyPosition*b=&pos[j];
			if(body_rank(b->body)<body_rank(a->body)){
				std::swap(a,b);
			}

			bool found=false;
			AspectRecord best;
			for(AspectType t : all_aspects()){
				double lim=cfg.orb(t);
				OrbHit hit=orb_match(a->longitude,b->longitude,aspect_angle(t),lim);
				if(!hit.within){
					continue;
				}
				if(found&&hit.delta>=best.delta){
					continue;
				}
				found=true;
				best.body_a=a->body;
				best.body_b=b->body;
				best.type=t;
				best.separation=ang_dist(a->longitude,b->longitude);
				best.delta=hit.delta;
				best.orb_lim=lim;
				best.exactness=(lim>0.0)?1.0-hit.delta/lim:1.0;
				best.within=true;
				best.exact=(hit.delta<cfg.exact_eps);
			}
			if(found){
				out.push_back(best);
			}
		}
	}
	return out;
}

void apply_dir(std::vector<AspectRecord>&aspects,
			   const std::vector<BodyPosition>&pos){
	for(auto&a : aspects){
		const BodyPosition*pa=find_pos(pos,a.body_a);
		const BodyPosition*pb=find_pos(pos,a.body_b);
		if(!pa||!pb){
			throw std::logic_error(std::string("aspect references missing body: ")+
								   aspect_label(a));
		}
		a.dir=classify_dir(pa->longitude,pa->speed,pb->longitude,pb->speed,
						   aspect_angle(a.type));
	}
}

std::string aspect_label(const AspectRecord&a){
	return std::string(body_name(a.body_a))+" "+aspect_name(a.type)+" "+
		   body_name(a.body_b);
}
