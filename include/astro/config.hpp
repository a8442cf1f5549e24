#pragma once

#include<iosfwd>
#include<string>

#include "astro/snapshot.hpp"

struct EngineCfg{
	SnapCfg snap;
	std::string bsp;
	std::string table;
	std::string tz="Z";
	std::string def_fmt="txt";
	bool pretty=true;
	int jobs=1;
};

extern const std::string CFG_FILE;

std::string trim(const std::string&s);

// Applies one key=value pair; throws ConfigError on unknown keys or bad values.
void apply_kv(EngineCfg&cfg,const std::string&key,const std::string&value);

void parse_cfg(std::istream&is,const std::string&src,EngineCfg&cfg);

// false when the file does not exist; throws ConfigError on bad content
bool load_cfg(const std::string&path,EngineCfg&cfg);

bool save_cfg(const std::string&path,const EngineCfg&cfg);

void dump_cfg(std::ostream&os,const EngineCfg&cfg);
