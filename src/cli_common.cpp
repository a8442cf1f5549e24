#include "astro/cli_common.hpp"

#include<cctype>
#include<cmath>
#include<iostream>
#include<memory>
#include<stdexcept>

#include "astro/spice_ephem.hpp"

namespace cli_util{

bool is_opt(const std::string&s){ return !s.empty()&&s[0]=='-'; }

std::string to_low(std::string s){
	for(char&c : s){
		c=static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return s;
}

int parse_int(const std::string&text,const std::string&label){
	std::size_t pos=0;
	int v=0;
	try{
		v=std::stoi(text,&pos);
	}catch(const std::exception&){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	if(pos!=text.size()){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	return v;
}

double parse_num(const std::string&text,const std::string&label){
	std::size_t pos=0;
	double v=0.0;
	try{
		v=std::stod(text,&pos);
	}catch(const std::exception&){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	if(pos!=text.size()||!std::isfinite(v)){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	return v;
}

bool parse_bool01(const std::string&text,const std::string&label){
	if(text=="0"){
		return false;
	}
	if(text=="1"){
		return true;
	}
	throw std::invalid_argument(label+" must be 0 or 1");
}

std::string req_val(const std::vector<std::string>&args,std::size_t&idx,
					const std::string&opt){
	if(idx+1>=args.size()){
		throw std::invalid_argument("missing value for option: "+opt);
	}
	++idx;
	return args[idx];
}

OutTgt open_out(const std::string&path){
	OutTgt out;
	if(path.empty()){
		out.stream=&std::cout;
		return out;
	}
	out.file.open(path,std::ios::binary);
	if(!out.file){
		throw std::runtime_error("failed to open output file: "+path);
	}
	out.stream=&out.file;
	return out;
}

void note_out(const std::string&path,bool quiet){
	if(!path.empty()&&!quiet){
		std::cerr<<"written: "<<path<<std::endl;
	}
}

void chk_fmt(const std::string&format,const std::set<std::string>&allowed,
			 const std::string&ctx){
	if(allowed.find(format)==allowed.end()){
		throw std::invalid_argument("invalid --format for "+ctx+": "+format);
	}
}

ProviderFactory mk_factory(const std::string&bsp,const std::string&table){
	if(!table.empty()){
		TableEphem tab=TableEphem::load_tsv(table);
		return [tab](){ return std::make_unique<TableEphem>(tab); };
	}
	if(!bsp.empty()){
		return spice_factory(bsp);
	}
	throw std::invalid_argument(
		"no ephemeris: pass --bsp <kernel> or --table <tsv>, or set bsp in "
		"the config file");
}

std::string prov_label(const std::string&bsp,const std::string&table){
	if(!table.empty()){
		return "table:"+table;
	}
	return "spice:"+bsp;
}

} // namespace cli_util
