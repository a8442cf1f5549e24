#include "astro/cli.hpp"
#include "astro/cli_common.hpp"

#include<cmath>
#include<fstream>
#include<functional>
#include<iostream>
#include<sstream>
#include<stdexcept>
#include<unordered_map>

#include "astro/angle.hpp"
#include "astro/batch.hpp"
#include "astro/errors.hpp"
#include "astro/format.hpp"
#include "astro/js_writer.hpp"
#include "astro/snap_out.hpp"
#include "astro/spice_ephem.hpp"

namespace{

using cli_util::OutTgt;
using cli_util::chk_fmt;
using cli_util::is_opt;
using cli_util::mk_factory;
using cli_util::note_out;
using cli_util::open_out;
using cli_util::parse_bool01;
using cli_util::parse_int;
using cli_util::parse_num;
using cli_util::prov_label;
using cli_util::req_val;
using cli_util::to_low;

using OptHandler=
	std::function<void(const std::vector<std::string>&,std::size_t&,
					   const std::string&)>;
using OptMap=std::unordered_map<std::string,OptHandler>;

void apply_opt(const OptMap&handlers,const std::vector<std::string>&args,
			   std::size_t&idx,const std::string&opt,const std::string&ctx){
	auto it=handlers.find(opt);
	if(it==handlers.end()){
		throw std::invalid_argument("unknown option for "+ctx+": "+opt);
	}
	it->second(args,idx,opt);
}

using FmtHandler=std::function<void()>;
using FmtMap=std::unordered_map<std::string,FmtHandler>;

void run_fmt(const FmtMap&handlers,const std::string&format,
			 const std::string&ctx){
	auto it=handlers.find(format);
	if(it==handlers.end()){
		throw std::invalid_argument("invalid --format for "+ctx+": "+format);
	}
	it->second();
}

void add_common(OptMap&h,CommonArgs&c){
	h["--config"]=[&c](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){ c.cfg_path=req_val(src,idx,opt); };
	h["--bsp"]=[&c](const std::vector<std::string>&src,std::size_t&idx,
					const std::string&opt){ c.bsp=req_val(src,idx,opt); };
	h["--table"]=[&c](const std::vector<std::string>&src,std::size_t&idx,
					  const std::string&opt){ c.table=req_val(src,idx,opt); };
	h["--tz"]=[&c](const std::vector<std::string>&src,std::size_t&idx,
				   const std::string&opt){ c.tz=req_val(src,idx,opt); };
	h["--format"]=[&c](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){
		c.format=to_low(req_val(src,idx,opt));
	};
	h["--out"]=[&c](const std::vector<std::string>&src,std::size_t&idx,
					const std::string&opt){ c.out=req_val(src,idx,opt); };
	h["--pretty"]=[&c](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){
		c.pretty=parse_bool01(req_val(src,idx,opt),"--pretty")?1:0;
	};
	h["--jobs"]=[&c](const std::vector<std::string>&src,std::size_t&idx,
					 const std::string&opt){
		c.jobs=parse_int(req_val(src,idx,opt),"--jobs");
		if(c.jobs<1||c.jobs>64){
			throw std::invalid_argument("--jobs must be within [1,64]");
		}
	};
	h["--quiet"]=[&c](const std::vector<std::string>&,std::size_t&,
					  const std::string&){ c.quiet=true; };
}

std::vector<std::string> read_lines(const std::string&path){
	std::ifstream ifs;
	std::istream*is=&std::cin;
	if(path!="-"){
		ifs.open(path);
		if(!ifs){
			throw std::runtime_error("failed to open input file: "+path);
		}
		is=&ifs;
	}
	std::vector<std::string> out;
	std::string line;
	while(std::getline(*is,line)){
		std::string t=trim(line);
		if(t.empty()||t[0]=='#'){
			continue;
		}
		out.push_back(t);
	}
	return out;
}

int report_batch(const std::vector<BatchItem>&items,bool quiet){
	std::size_t bad=0;
	for(const auto&it : items){
		if(!it.ok){
			++bad;
		}
	}
	if(bad==0){
		return 0;
	}
	if(!quiet){
		std::cerr<<"[warn] "<<bad<<" of "<<items.size()<<" instants failed"
				 <<std::endl;
	}
	return 1;
}

void wr_batch(const CommonArgs&c,const EngineCfg&cfg,
			  const std::vector<BatchItem>&items,const std::string&ctx){
	const std::string format=to_low(cfg.def_fmt);
	int tz_off=parse_tz(cfg.tz);
	std::string prov=prov_label(cfg.bsp,cfg.table);
	OutTgt out=open_out(c.out);
	const FmtMap handlers={
		{"json",[&](){ batch_json(*out.stream,items,prov,cfg.tz,cfg.pretty); }},
		{"txt",[&](){ batch_txt(*out.stream,items,tz_off); }},
	};
	run_fmt(handlers,format,ctx);
	note_out(c.out,c.quiet);
}

void wr_cfgjs(std::ostream&os,const EngineCfg&cfg,const std::string&path,
			  bool pretty){
	const SnapCfg&sc=cfg.snap;
	JsonWriter w(os,pretty);
	w.obj_begin();
	w.key("meta");
	w.obj_begin();
	w.kv("tool","astro");
	w.kv("schema",SNAP_SCHEMA);
	w.kv("path",path);
	w.obj_end();
	w.key("data");
	w.obj_begin();
	w.kv("bsp",cfg.bsp);
	w.kv("table",cfg.table);
	w.kv("tz",cfg.tz);
	w.kv("format",cfg.def_fmt);
	w.kv("pretty",cfg.pretty);
	w.kv("jobs",cfg.jobs);
	w.key("bodies");
	w.arr_begin();
	for(Body b : sc.bodies){
		w.value(body_name(b));
	}
	w.arr_end();
	w.kv("jd_min",sc.jd_min);
	w.kv("jd_max",sc.jd_max);
	w.kv("exact_eps",sc.aspect.exact_eps);
	w.key("aspects");
	w.obj_begin();
	for(AspectType t : all_aspects()){
		w.key(aspect_name(t));
		w.obj_begin();
		w.kv("angle",aspect_angle(t));
		w.kv("orb",sc.aspect.orb(t));
		w.kv("weight",sc.score.weight(t));
		w.kv("major",sc.score.is_major(t));
		w.obj_end();
	}
	w.obj_end();
	w.kv("base",sc.score.base);
	w.kv("phase_bonus",sc.score.phase_bonus);
	w.kv("notable_orb",sc.score.notable_orb);
	w.kv("bullish_at",sc.score.bullish_at);
	w.kv("bearish_at",sc.score.bearish_at);
	w.obj_end();
	w.obj_end();
	os<<"\n";
}

struct Case{
	std::string id;
	bool pass=false;
	std::string message;
};

void run_case(std::vector<Case>&cases,const std::string&id,
			  const std::function<std::string(bool&)>&fn){
	Case c;
	c.id=id;
	try{
		c.message=fn(c.pass);
	}catch(const std::exception&ex){
		c.pass=false;
		c.message=ex.what();
	}
	cases.push_back(c);
}

TableEphem demo_table(){
	TableEphem t(J2000_JD);
	t.set(Body::SUN,100.0,0.9856);
	t.set(Body::MOON,280.0,13.18);
	t.set(Body::MERCURY,112.0,1.2);
	t.set(Body::VENUS,160.0,1.1);
	t.set(Body::MARS,10.0,0.5);
	t.set(Body::JUPITER,220.0,-0.05);
	t.set(Body::SATURN,40.0,0.03);
	t.set(Body::URANUS,300.0,0.01);
	t.set(Body::NEPTUNE,330.0,0.006);
	t.set(Body::PLUTO,250.0,0.004);
	return t;
}

std::vector<Case> self_cases(const std::string&bsp,bool quiet){
	std::vector<Case> cases;
	std::ostream*log=quiet?nullptr:&std::cerr;

	run_case(cases,"opp_exact",[&](bool&pass){
		TableEphem t=demo_table();
		SnapAsm engine(t,SnapCfg());
		DailySnapshot s=engine.build(J2000_JD,log);
		const AspectRecord*a=s.aspect_between(Body::SUN,Body::MOON);
		pass=a&&a->type==AspectType::OPPOSITION&&a->exact&&a->delta<1e-9;
		return std::string(pass?"ok":"Sun/Moon opposition not exact");
	});

	run_case(cases,"partial_body",[&](bool&pass){
		TableEphem t=demo_table();
		t.fail(Body::MARS,"selftest");
		SnapAsm engine(t,SnapCfg());
		DailySnapshot s=engine.build(J2000_JD,nullptr);
		pass=s.positions.size()==BODY_COUNT-1&&s.failures.size()==1&&
			 s.status==SnapStatus::PARTIAL&&s.aspects_for(Body::MARS).empty();
		std::ostringstream msg;
		msg<<"positions="<<s.positions.size()<<", failures="<<s.failures.size();
		return msg.str();
	});

	run_case(cases,"insufficient",[&](bool&pass){
		TableEphem t;
		t.set(Body::SUN,0.0,1.0);
		SnapAsm engine(t,SnapCfg());
		DailySnapshot s=engine.build(J2000_JD,nullptr);
		pass=s.insufficient()&&s.aspects.empty()&&s.score>=0.0&&s.score<=100.0;
		return std::string(pass?"ok":"expected insufficient snapshot");
	});

	run_case(cases,"bounds",[&](bool&pass){
		TableEphem t=demo_table();
		SnapAsm engine(t,SnapCfg());
		try{
			engine.build(greg2jd(1500,1,1),nullptr);
		}catch(const InvalidInstant&){
			pass=true;
			return std::string("ok");
		}
		pass=false;
		return std::string("out-of-range instant accepted");
	});

	run_case(cases,"batch_order",[&](bool&pass){
		TableEphem t=demo_table();
		ProviderFactory fac=[t](){
			return std::make_unique<TableEphem>(t);
		};
		std::vector<double> days=day_range(J2000_JD,J2000_JD+29.0);
		auto one=run_batch(fac,SnapCfg(),days,1);
		auto many=run_batch(fac,SnapCfg(),days,4);
		pass=one.size()==many.size();
		for(std::size_t i=0;pass&&i<one.size();++i){
			pass=one[i].ok&&many[i].ok&&one[i].jd_utc==many[i].jd_utc&&
				 one[i].snap.score==many[i].snap.score;
		}
		return std::string(pass?"ok":"batch results differ by job count");
	});

	if(bsp.empty()){
		return cases;
	}

	run_case(cases,"spice_sun",[&](bool&pass){
		SpiceEphem eph(bsp);
		BodyState st=eph.state(J2000_JD,Body::SUN);
		double d=ang_dist(st.longitude,280.37);
		pass=d<0.1&&st.speed>0.95&&st.speed<1.05;
		std::ostringstream msg;
		msg<<"sun_lon="<<st.longitude<<", speed="<<st.speed;
		return msg.str();
	});

	run_case(cases,"spice_all",[&](bool&pass){
		SpiceEphem eph(bsp);
		SnapAsm engine(eph,SnapCfg());
		DailySnapshot s=engine.build(greg2jd(2025,6,1),log);
		pass=s.status==SnapStatus::COMPLETE&&s.phase_ok;
		std::ostringstream msg;
		msg<<"positions="<<s.positions.size()<<", aspects="<<s.aspects.size()
		   <<", score="<<s.score;
		return msg.str();
	});

	return cases;
}

}

EngineCfg res_cfg(const CommonArgs&args){
	EngineCfg cfg;
	std::string path=args.cfg_path.empty()?CFG_FILE:args.cfg_path;
	if(!load_cfg(path,cfg)&&!args.cfg_path.empty()){
		throw std::invalid_argument("config file not found: "+path);
	}
	if(!args.bsp.empty()){
		cfg.bsp=args.bsp;
		cfg.table.clear();
	}
	if(!args.table.empty()){
		cfg.table=args.table;
	}
	if(!args.tz.empty()){
		parse_tz(args.tz);
		cfg.tz=args.tz;
	}
	if(!args.format.empty()){
		cfg.def_fmt=args.format;
	}
	if(args.pretty>=0){
		cfg.pretty=args.pretty!=0;
	}
	if(args.jobs>0){
		cfg.jobs=args.jobs;
	}
	return cfg;
}

int cli_snap(const SnapArgs&args){
	EngineCfg cfg=res_cfg(args.common);
	const std::string format=to_low(cfg.def_fmt);
	chk_fmt(format,{"json","txt"},"snapshot");
	int tz_off=parse_tz(cfg.tz);
	std::ostream*log=args.common.quiet?nullptr:&std::cerr;

	std::vector<std::string> texts=args.instants;
	if(!args.input_file.empty()){
		std::vector<std::string> more=read_lines(args.input_file);
		texts.insert(texts.end(),more.begin(),more.end());
	}
	if(texts.empty()){
		throw std::invalid_argument("snapshot requires at least one instant");
	}
	std::vector<double> instants;
	instants.reserve(texts.size());
	for(const auto&t : texts){
		instants.push_back(to_instant(t,cfg.tz));
	}

	ProviderFactory fac=mk_factory(cfg.bsp,cfg.table);
	if(instants.size()>1){
		auto items=run_batch(fac,cfg.snap,instants,cfg.jobs,log);
		wr_batch(args.common,cfg,items,"snapshot");
		return report_batch(items,args.common.quiet);
	}

	std::unique_ptr<EphemProvider> eph=fac();
	SnapAsm engine(*eph,cfg.snap);
	DailySnapshot s=engine.build(instants[0],log);
	OutTgt out=open_out(args.common.out);
	const FmtMap handlers={
		{"json",[&](){
			 snap_json(*out.stream,s,eph->describe(),cfg.tz,cfg.pretty);
		 }},
		{"txt",[&](){ snap_txt(*out.stream,s,tz_off); }},
	};
	run_fmt(handlers,format,"snapshot");
	note_out(args.common.out,args.common.quiet);
	return 0;
}

int cli_range(const RangeArgs&args){
	EngineCfg cfg=res_cfg(args.common);
	chk_fmt(to_low(cfg.def_fmt),{"json","txt"},"range");
	double jd0=to_instant(args.start,cfg.tz);
	double jd1=to_instant(args.end,cfg.tz);
	std::vector<double> days=day_range(jd0,jd1,args.step);

	ProviderFactory fac=mk_factory(cfg.bsp,cfg.table);
	auto items=run_batch(fac,cfg.snap,days,cfg.jobs,
						 args.common.quiet?nullptr:&std::cerr);
	wr_batch(args.common,cfg,items,"range");
	return report_batch(items,args.common.quiet);
}

int cmd_snap(const std::vector<std::string>&args){
	if(args.empty()||(args.size()==1&&(args[0]=="-h"||args[0]=="--help"))){
		use_snap();
		return 0;
	}
	SnapArgs sargs;
	OptMap handlers;
	add_common(handlers,sargs.common);
	handlers["--input"]=[&](const std::vector<std::string>&src,std::size_t&idx,
							const std::string&opt){
		sargs.input_file=req_val(src,idx,opt);
	};
	handlers["--stdin"]=[&](const std::vector<std::string>&,std::size_t&,
							const std::string&){ sargs.input_file="-"; };

	for(std::size_t i=0;i<args.size();++i){
		const std::string&a=args[i];
		if(a=="-h"||a=="--help"){
			use_snap();
			return 0;
		}
		if(is_opt(a)){
			apply_opt(handlers,args,i,a,"snapshot");
		}else{
			sargs.instants.push_back(a);
		}
	}
	return cli_snap(sargs);
}

int cmd_range(const std::vector<std::string>&args){
	if(args.size()==1&&(args[0]=="-h"||args[0]=="--help")){
		use_range();
		return 0;
	}
	if(args.size()<2||is_opt(args[0])||is_opt(args[1])){
		throw std::invalid_argument("range requires: <start> <end>");
	}
	RangeArgs rargs;
	rargs.start=args[0];
	rargs.end=args[1];
	OptMap handlers;
	add_common(handlers,rargs.common);
	handlers["--step"]=[&](const std::vector<std::string>&src,std::size_t&idx,
						   const std::string&opt){
		rargs.step=parse_num(req_val(src,idx,opt),"--step");
	};

	for(std::size_t i=2;i<args.size();++i){
		const std::string&a=args[i];
		if(a=="-h"||a=="--help"){
			use_range();
			return 0;
		}
		apply_opt(handlers,args,i,a,"range");
	}
	return cli_range(rargs);
}

int cmd_test(const std::vector<std::string>&args){
	if(args.size()==1&&(args[0]=="-h"||args[0]=="--help")){
		use_test();
		return 0;
	}
	CommonArgs c;
	OptMap handlers;
	add_common(handlers,c);
	std::size_t first=0;
	if(!args.empty()&&!is_opt(args[0])){
		c.bsp=args[0];
		first=1;
	}
	for(std::size_t i=first;i<args.size();++i){
		apply_opt(handlers,args,i,args[i],"selftest");
	}
	EngineCfg cfg=res_cfg(c);
	const std::string format=to_low(cfg.def_fmt);
	chk_fmt(format,{"json","txt"},"selftest");

	std::vector<Case> cases=self_cases(cfg.bsp,c.quiet);
	bool all_pass=true;
	for(const auto&cs : cases){
		all_pass=all_pass&&cs.pass;
	}

	OutTgt out=open_out(c.out);
	if(format=="json"){
		JsonWriter w(*out.stream,cfg.pretty);
		w.obj_begin();
		w.key("meta");
		w.obj_begin();
		w.kv("tool","astro");
		w.kv("schema",SNAP_SCHEMA);
		w.kv("type","selftest");
		w.kv("provider",cfg.bsp.empty()?std::string("table"):prov_label(cfg.bsp,""));
		w.obj_end();
		w.key("data");
		w.obj_begin();
		w.kv("pass",all_pass);
		w.key("cases");
		w.arr_begin();
		for(const auto&cs : cases){
			w.obj_begin();
			w.kv("id",cs.id);
			w.kv("pass",cs.pass);
			w.kv("message",cs.message);
			w.obj_end();
		}
		w.arr_end();
		w.obj_end();
		w.obj_end();
		*out.stream<<"\n";
	}else{
		std::ostream&os=*out.stream;
		os<<"tool=astro format=txt type=selftest\n";
		os<<"result.pass="<<(all_pass?"1":"0")<<"\n";
		os<<"id\tpass\tmessage\n";
		for(const auto&cs : cases){
			os<<cs.id<<"\t"<<(cs.pass?"1":"0")<<"\t"<<cs.message<<"\n";
		}
	}
	note_out(c.out,c.quiet);
	return all_pass?0:1;
}

int cmd_cfg(const std::vector<std::string>&args){
	if(args.empty()||(args.size()==1&&(args[0]=="-h"||args[0]=="--help"))){
		use_cfg();
		return 0;
	}
	std::string action=to_low(args[0]);
	std::string path=CFG_FILE;
	std::string format="txt";
	std::string out_path;
	bool pretty=true;
	bool quiet=false;

	auto parse_opt=[&](std::size_t start){
		for(std::size_t i=start;i<args.size();++i){
			const std::string&opt=args[i];
			if(opt=="--config"){
				path=req_val(args,i,opt);
			}else if(opt=="--format"){
				format=to_low(req_val(args,i,opt));
			}else if(opt=="--out"){
				out_path=req_val(args,i,opt);
			}else if(opt=="--pretty"){
				pretty=parse_bool01(req_val(args,i,opt),"--pretty");
			}else if(opt=="--quiet"){
				quiet=true;
			}else{
				throw std::invalid_argument("unknown option for config: "+opt);
			}
		}
	};

	if(action=="path"){
		parse_opt(1);
		std::cout<<path<<"\n";
		return 0;
	}

	if(action=="show"){
		parse_opt(1);
		chk_fmt(format,{"json","txt"},"config show");
		EngineCfg cfg;
		load_cfg(path,cfg);
		OutTgt out=open_out(out_path);
		if(format=="json"){
			wr_cfgjs(*out.stream,cfg,path,pretty);
		}else{
			*out.stream<<"tool=astro format=txt type=config path="<<path<<"\n";
			dump_cfg(*out.stream,cfg);
		}
		note_out(out_path,quiet);
		return 0;
	}

	if(action=="set"){
		if(args.size()<3){
			throw std::invalid_argument("config set requires: <key> <value>");
		}
		std::string key=to_low(args[1]);
		std::string value=args[2];
		parse_opt(3);
		EngineCfg cfg;
		load_cfg(path,cfg);
		apply_kv(cfg,key,value);
		cfg.snap.validate();
		if(!save_cfg(path,cfg)){
			throw std::runtime_error("failed to save config: "+path);
		}
		if(!quiet){
			std::cerr<<"written: "<<path<<"\n";
		}
		return 0;
	}

	throw std::invalid_argument("config action must be show, set or path");
}

std::string tool_ver(){ return "astro-cli-2026.10"; }

void use_snap(){
	std::cout<<"Usage:\n"
			 <<"  astro snapshot <when> [<when>...] [--input <file>|--stdin]\n"
			 <<"    [--bsp <kernel>|--table <tsv>] [--config <path>]\n"
			 <<"    [--format json|txt] [--out <path>] [--tz +08:00|Z|-05:00]\n"
			 <<"    [--pretty 0|1] [--jobs N] [--quiet]\n"
			 <<"Examples:\n"
			 <<"  astro snapshot 2025-06-01 --bsp de440s.bsp\n"
			 <<"  astro snapshot 2025-06-01T09:30+08:00 --format json\n"
			 <<"  astro snapshot --input days.txt --jobs 4 --table bodies.tsv\n"
			 <<"Notes:\n"
			 <<"  <when> without an offset is read in --tz.\n"
			 <<"  A body the ephemeris cannot resolve is reported, not fatal.\n";
}

void use_range(){
	std::cout<<"Usage:\n"
			 <<"  astro range <start> <end> [--step <days>] [--jobs N]\n"
			 <<"    [--bsp <kernel>|--table <tsv>] [--config <path>]\n"
			 <<"    [--format json|txt] [--out <path>] [--tz ...]\n"
			 <<"    [--pretty 0|1] [--quiet]\n"
			 <<"Examples:\n"
			 <<"  astro range 2025-01-01 2025-12-31 --bsp de440s.bsp --jobs 8\n"
			 <<"  astro range 2025-03-01 2025-03-31 --format json --out mar.json\n"
			 <<"Notes:\n"
			 <<"  Exit status is 1 when any instant in the range failed.\n";
}

void use_test(){
	std::cout<<"Usage:\n"
			 <<"  astro selftest [<bsp>|--bsp <kernel>] [--config <path>]\n"
			 <<"    [--format json|txt] [--out <path>] [--pretty 0|1] [--quiet]\n"
			 <<"Notes:\n"
			 <<"  Kernel checks run only when a kernel is configured.\n";
}

void use_cfg(){
	std::cout<<"Usage:\n"
			 <<"  astro config show [--config <path>] [--format json|txt]\n"
			 <<"    [--out <path>] [--pretty 0|1] [--quiet]\n"
			 <<"  astro config set <key> <value> [--config <path>] [--quiet]\n"
			 <<"  astro config path [--config <path>]\n"
			 <<"Keys:\n"
			 <<"  bsp table tz format pretty jobs bodies jd_min jd_max\n"
			 <<"  exact_eps orb.<aspect> weight.<aspect> major base\n"
			 <<"  phase_bonus notable_orb bullish_at bearish_at\n"
			 <<"Examples:\n"
			 <<"  astro config set bsp D:\\de440s.bsp\n"
			 <<"  astro config set orb.square 7.5\n"
			 <<"  astro config set major conjunction,opposition,square\n";
}

void use_main(){
	std::cout<<"Usage:\n"
			 <<"  astro --help\n"
			 <<"  astro --version\n"
			 <<"  astro snapshot ...\n"
			 <<"  astro range    ...\n"
			 <<"  astro selftest ...\n"
			 <<"  astro config   ...\n"
			 <<"\n"
			 <<"Subcommand help:\n"
			 <<"  astro snapshot --help\n"
			 <<"  astro range --help\n"
			 <<"  astro selftest --help\n"
			 <<"  astro config --help\n";
}
