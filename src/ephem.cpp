#include "astro/ephem.hpp"

#include<cmath>
#include<fstream>
#include<istream>
#include<sstream>
#include<stdexcept>
#include<vector>

#include "astro/angle.hpp"
#include "astro/errors.hpp"

namespace{

std::vector<std::string> split_tab(const std::string&line){
	std::vector<std::string> fields;
	std::string cur;
	for(char c : line){
		if(c=='\t'){
			fields.push_back(cur);
			cur.clear();
		}else if(c!='\r'){
			cur.push_back(c);
		}
	}
	fields.push_back(cur);
	return fields;
}

double to_num(const std::string&text,const std::string&where){
	std::size_t pos=0;
	double v=0.0;
	try{
		v=std::stod(text,&pos);
	}catch(const std::exception&){
		throw std::invalid_argument(where+": invalid number: "+text);
	}
	if(pos!=text.size()||!std::isfinite(v)){
		throw std::invalid_argument(where+": invalid number: "+text);
	}
	return v;
}

}

TableEphem::TableEphem(double epoch_jd) : epoch_(epoch_jd){}

void TableEphem::set(Body body,double lon0,double speed){
	BodyState st;
	st.longitude=lon0;
	st.speed=speed;
	rows_[body]=st;
	fails_.erase(body);
}

void TableEphem::fail(Body body,const std::string&reason){
	fails_[body]=reason;
}

bool TableEphem::has(Body body) const{
	return rows_.count(body)>0&&fails_.count(body)==0;
}

TableEphem TableEphem::load_tsv(const std::string&path){
	std::ifstream ifs(path);
	if(!ifs){
		throw std::runtime_error("failed to open ephemeris table: "+path);
	}
	return parse_tsv(ifs,path);
}

TableEphem TableEphem::parse_tsv(std::istream&is,const std::string&src){
	TableEphem t;
	std::string line;
	int line_no=0;
	while(std::getline(is,line)){
		++line_no;
		if(line.empty()||line[0]=='#'||line=="\r"){
			continue;
		}
		std::string where=src+":"+std::to_string(line_no);
		std::vector<std::string> f=split_tab(line);
		if(f[0]=="epoch"){
			if(f.size()!=2){
				throw std::invalid_argument(where+": expected epoch<TAB><jd>");
			}
			t.epoch_=to_num(f[1],where);
			continue;
		}
		Body b=parse_body(f[0]);
		if(f.size()==2&&f[1]=="fail"){
			t.fail(b);
			continue;
		}
		if(f.size()!=3){
			throw std::invalid_argument(
				where+": expected body<TAB>longitude<TAB>speed");
		}
		t.set(b,to_num(f[1],where),to_num(f[2],where));
	}
	return t;
}

BodyState TableEphem::state(double jd_utc,Body body){
	auto fit=fails_.find(body);
	if(fit!=fails_.end()){
		throw BodyUnavailable(body,fit->second);
	}
	auto it=rows_.find(body);
	if(it==rows_.end()){
		throw BodyUnavailable(body,"not in table");
	}
	double lon=it->second.longitude+it->second.speed*(jd_utc-epoch_);
	if(!std::isfinite(lon)){
		throw BodyUnavailable(body,"longitude overflows at JD "+
									   std::to_string(jd_utc));
	}
	BodyState st;
	st.longitude=norm_deg(lon);
	st.speed=it->second.speed;
	return st;
}

std::string TableEphem::describe() const{
	std::ostringstream oss;
	oss<<"table(epoch="<<epoch_<<", bodies="<<rows_.size()<<")";
	return oss.str();
}
