#pragma once

#include<cstddef>
#include<fstream>
#include<set>
#include<string>
#include<vector>

#include "astro/ephem.hpp"

namespace cli_util{

struct OutTgt{
	std::ofstream file;
	std::ostream*stream=nullptr;
};

bool is_opt(const std::string&s);

std::string to_low(std::string s);

int parse_int(const std::string&text,const std::string&label);

double parse_num(const std::string&text,const std::string&label);

bool parse_bool01(const std::string&text,const std::string&label);

std::string req_val(const std::vector<std::string>&args,std::size_t&idx,
					const std::string&opt);

OutTgt open_out(const std::string&path);

void note_out(const std::string&path,bool quiet);

void chk_fmt(const std::string&format,const std::set<std::string>&allowed,
			 const std::string&ctx);

// --table wins over --bsp; throws std::invalid_argument when both are empty
ProviderFactory mk_factory(const std::string&bsp,const std::string&table);

std::string prov_label(const std::string&bsp,const std::string&table);

} // namespace cli_util
