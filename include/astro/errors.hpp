#pragma once

#include<stdexcept>
#include<string>

#include "astro/body.hpp"

struct InvalidInstant : std::invalid_argument{
	explicit InvalidInstant(const std::string&msg)
		: std::invalid_argument("invalid instant: "+msg){}
};

struct ConfigError : std::invalid_argument{
	explicit ConfigError(const std::string&msg)
		: std::invalid_argument("config error: "+msg){}
};

struct BodyUnavailable : std::runtime_error{
	Body body;

	BodyUnavailable(Body b,const std::string&msg)
		: std::runtime_error(std::string(body_name(b))+" unavailable: "+msg),
		  body(b){}
};
