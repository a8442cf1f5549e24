#include "astro/js_writer.hpp"

#include<cmath>
#include<iomanip>
#include<ostream>
#include<sstream>
#include<stdexcept>

std::string js_escape(const std::string&s){
	std::string out;
	out.reserve(s.size());
	for(unsigned char c : s){
		switch(c){
		case '"':
			out+="\\\"";
			break;
		case '\\':
			out+="\\\\";
			break;
		case '\b':
			out+="\\b";
			break;
		case '\f':
			out+="\\f";
			break;
		case '\n':
			out+="\\n";
			break;
		case '\r':
			out+="\\r";
			break;
		case '\t':
			out+="\\t";
			break;
		default:
			if(c<0x20){
				std::ostringstream oss;
				oss<<"\\u"<<std::hex<<std::setw(4)<<std::setfill('0')
				   <<static_cast<int>(c);
				out+=oss.str();
			}else{
				out.push_back(static_cast<char>(c));
			}
			break;
		}
	}
	return out;
}

JsonWriter::JsonWriter(std::ostream&os,bool pretty,int ind_size)
	: os_(os),pretty_(pretty),ind_size_(ind_size){}

void JsonWriter::newline(){
	if(!pretty_){
		return;
	}
	os_<<'\n'<<std::string(stack_.size()*static_cast<std::size_t>(ind_size_),' ');
}

void JsonWriter::val_begin(){
	if(stack_.empty()){
		if(root_ok_){
			throw std::logic_error("multiple JSON roots");
		}
		root_ok_=true;
		return;
	}
	Frame&f=stack_.back();
	if(f.is_obj){
		if(!f.want_val){
			throw std::logic_error("value in object requires key()");
		}
		f.want_val=false;
		return;
	}
	if(!f.empty){
		os_<<',';
	}
	f.empty=false;
	newline();
}

void JsonWriter::close(bool is_obj,char ch){
	if(stack_.empty()||stack_.back().is_obj!=is_obj){
		throw std::logic_error(is_obj?"obj_end without obj_begin"
									 :"arr_end without arr_begin");
	}
	Frame f=stack_.back();
	if(f.want_val){
		throw std::logic_error("object key missing value");
	}
	stack_.pop_back();
	if(!f.empty){
		newline();
	}
	os_<<ch;
}

void JsonWriter::obj_begin(){
	val_begin();
	os_<<'{';
	stack_.push_back({true,true,false});
}

void JsonWriter::obj_end(){ close(true,'}'); }

void JsonWriter::arr_begin(){
	val_begin();
	os_<<'[';
	stack_.push_back({false,true,false});
}

void JsonWriter::arr_end(){ close(false,']'); }

void JsonWriter::key(const std::string&name){
	if(stack_.empty()||!stack_.back().is_obj){
		throw std::logic_error("key() outside object");
	}
	Frame&f=stack_.back();
	if(f.want_val){
		throw std::logic_error("previous key missing value");
	}
	if(!f.empty){
		os_<<',';
	}
	f.empty=false;
	newline();
	os_<<'"'<<js_escape(name)<<"\":";
	if(pretty_){
		os_<<' ';
	}
	f.want_val=true;
}

void JsonWriter::value(const std::string&v){
	val_begin();
	os_<<'"'<<js_escape(v)<<'"';
}

void JsonWriter::value(const char*v){ value(std::string(v?v:"")); }

void JsonWriter::value(double v){
	if(!std::isfinite(v)){
		null_val();
		return;
	}
	val_begin();
	std::ostringstream oss;
	oss<<std::setprecision(17)<<v;
	os_<<oss.str();
}

void JsonWriter::value(int v){
	val_begin();
	os_<<v;
}

void JsonWriter::value(bool v){
	val_begin();
	os_<<(v?"true":"false");
}

void JsonWriter::null_val(){
	val_begin();
	os_<<"null";
}
