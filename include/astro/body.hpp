#pragma once

#include<array>
#include<cstddef>
#include<string>
#include<vector>

enum class Body{ SUN,MOON,MERCURY,VENUS,MARS,JUPITER,SATURN,URANUS,NEPTUNE,PLUTO };

constexpr std::size_t BODY_COUNT=10;

enum class Zodiac{
	ARIES,
	TAURUS,
	GEMINI,
	CANCER,
	LEO,
	VIRGO,
	LIBRA,
	SCORPIO,
	SAGITTARIUS,
	CAPRICORN,
	AQUARIUS,
	PISCES
};

enum class Placement{ EARLY,MIDDLE,LATE };

const std::array<Body,BODY_COUNT>&all_bodies();

const char*body_name(Body b);

// case-insensitive; throws std::invalid_argument on unknown names
Body parse_body(const std::string&name);

std::vector<Body> parse_bodies(const std::string&csv);

const char*zodiac_name(Zodiac z);

const char*placement_name(Placement p);

int body_rank(Body b);

// raw provider output
struct BodyState{
	double longitude=0.0;
	double speed=0.0;
};

struct BodyPosition{
	Body body=Body::SUN;
	double longitude=0.0;
	double speed=0.0;
	Zodiac sign=Zodiac::ARIES;
	double deg_in_sign=0.0;
	Placement placement=Placement::EARLY;

	bool retrograde() const{ return speed<0.0; }
};

Zodiac sign_of(double longitude);

double deg_in_sign(double longitude);

Placement placement_of(double deg);

BodyPosition mk_pos(Body body,double longitude,double speed);
