#pragma once

#include<array>
#include<cstddef>
#include<string>
#include<vector>

#include "astro/body.hpp"
#include "astro/direction.hpp"

enum class AspectType{ CONJUNCTION,SEXTILE,SQUARE,TRINE,OPPOSITION };

constexpr std::size_t ASPECT_COUNT=5;

const std::array<AspectType,ASPECT_COUNT>&all_aspects();

const char*aspect_name(AspectType t);

AspectType parse_aspect(const std::string&name);

double aspect_angle(AspectType t);

struct AspectCfg{
	// indexed by AspectType
	std::array<double,ASPECT_COUNT> orbs={{8.0,6.0,8.0,8.0,8.0}};
	double exact_eps=0.1;

	double orb(AspectType t) const{ return orbs[static_cast<std::size_t>(t)]; }
	void set_orb(AspectType t,double v){ orbs[static_cast<std::size_t>(t)]=v; }

	// throws ConfigError
	void validate() const;
};

struct AspectRecord{
	Body body_a=Body::SUN;
	Body body_b=Body::SUN;
	AspectType type=AspectType::CONJUNCTION;
	double separation=0.0;
	double delta=0.0;
	double orb_lim=0.0;
	double exactness=0.0;
	bool within=false;
	bool exact=false;
	Direction dir=Direction::STATIONARY;

	bool involves(Body b) const{ return body_a==b||body_b==b; }
};

// All pairs i<j, best aspect per pair. dir is left STATIONARY.
std::vector<AspectRecord> detect_aspects(const std::vector<BodyPosition>&pos,
										 const AspectCfg&cfg);

// Fills AspectRecord::dir from the matching positions.
void apply_dir(std::vector<AspectRecord>&aspects,
			   const std::vector<BodyPosition>&pos);

std::string aspect_label(const AspectRecord&a);
