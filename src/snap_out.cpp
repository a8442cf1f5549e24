#include "astro/snap_out.hpp"

#include<iomanip>
#include<ostream>

#include "astro/format.hpp"

const char*const SNAP_SCHEMA="astro.v1";

void wr_pos(JsonWriter&w,const BodyPosition&p){
	w.obj_begin();
	w.kv("body",body_name(p.body));
	w.kv("longitude",p.longitude);
	w.kv("speed",p.speed);
	w.kv("sign",zodiac_name(p.sign));
	w.kv("degree_in_sign",p.deg_in_sign);
	w.kv("placement",placement_name(p.placement));
	w.kv("retrograde",p.retrograde());
	w.obj_end();
}

void wr_aspect(JsonWriter&w,const AspectRecord&a){
	w.obj_begin();
	w.kv("body_a",body_name(a.body_a));
	w.kv("body_b",body_name(a.body_b));
	w.kv("aspect",aspect_name(a.type));
	w.kv("separation",a.separation);
	w.kv("orb_delta",a.delta);
	w.kv("orb_limit",a.orb_lim);
	w.kv("exactness",a.exactness);
	w.kv("within_orb",a.within);
	w.kv("exact",a.exact);
	w.kv("direction",dir_name(a.dir));
	w.obj_end();
}

void wr_snap(JsonWriter&w,const DailySnapshot&s){
	w.obj_begin();
	w.kv("date",s.date);
	w.kv("jd_utc",s.jd_utc);
	w.kv("utc_iso",s.utc_iso);
	w.kv("status",status_name(s.status));
	w.kv("insufficient",s.insufficient());

	w.key("positions");
	w.arr_begin();
	for(const auto&p : s.positions){
		wr_pos(w,p);
	}
	w.arr_end();

	w.key("failures");
	w.arr_begin();
	for(const auto&f : s.failures){
		w.obj_begin();
		w.kv("body",body_name(f.body));
		w.kv("reason",f.reason);
		w.obj_end();
	}
	w.arr_end();

	w.key("aspects");
	w.arr_begin();
	for(const auto&a : s.aspects){
		wr_aspect(w,a);
	}
	w.arr_end();

	w.key("lunar_phase");
	if(s.phase_ok){
		w.obj_begin();
		w.kv("name",phase_name(s.phase.name));
		w.kv("angle",s.phase.angle);
		w.kv("illumination",s.phase.illum);
		w.obj_end();
	}else{
		w.null_val();
	}

	w.key("significant_events");
	w.arr_begin();
	for(const auto&e : s.events){
		w.value(e);
	}
	w.arr_end();

	w.kv("daily_score",s.score);
	w.kv("market_outlook",outlook_name(s.outlook));
	w.obj_end();
}

void wr_meta(JsonWriter&w,const std::string&provider,const std::string&tz){
	w.key("meta");
	w.obj_begin();
	w.kv("tool","astro");
	w.kv("schema",SNAP_SCHEMA);
	w.kv("provider",provider);
	w.kv("tz_display",tz);
	w.obj_end();
}

void snap_json(std::ostream&os,const DailySnapshot&s,
			   const std::string&provider,const std::string&tz,bool pretty){
	JsonWriter w(os,pretty);
	w.obj_begin();
	wr_meta(w,provider,tz);
	w.key("data");
	wr_snap(w,s);
	w.obj_end();
	os<<"\n";
}

void batch_json(std::ostream&os,const std::vector<BatchItem>&items,
				const std::string&provider,const std::string&tz,bool pretty){
	JsonWriter w(os,pretty);
	w.obj_begin();
	wr_meta(w,provider,tz);
	w.key("data");
	w.arr_begin();
	for(const auto&it : items){
		if(it.ok){
			wr_snap(w,it.snap);
		}else{
			w.obj_begin();
			w.kv("jd_utc",it.jd_utc);
			w.kv("error",it.error);
			w.obj_end();
		}
	}
	w.arr_end();
	w.obj_end();
	os<<"\n";
}

void snap_txt(std::ostream&os,const DailySnapshot&s,int tz_off){
	os<<"date="<<s.date<<" local="<<fmt_iso(s.jd_utc,tz_off,false)
	  <<" status="<<status_name(s.status)<<"\n";
	os<<std::fixed<<std::setprecision(4);
	for(const auto&p : s.positions){
		os<<"  pos "<<std::left<<std::setw(8)<<body_name(p.body)<<std::right
		  <<std::setw(9)<<p.longitude<<" "<<zodiac_name(p.sign)<<" "
		  <<std::setprecision(2)<<p.deg_in_sign<<" ("
		  <<placement_name(p.placement)<<") speed="<<std::setprecision(4)
		  <<p.speed<<(p.retrograde()?" R":"")<<"\n";
	}
	for(const auto&f : s.failures){
		os<<"  fail "<<body_name(f.body)<<": "<<f.reason<<"\n";
	}
	for(const auto&a : s.aspects){
		os<<"  aspect "<<aspect_label(a)<<" sep="<<a.separation
		  <<" delta="<<a.delta<<" "<<dir_name(a.dir)<<(a.exact?" exact":"")
		  <<"\n";
	}
	if(s.phase_ok){
		os<<"  phase "<<phase_name(s.phase.name)<<" angle="<<s.phase.angle
		  <<" illum="<<std::setprecision(1)<<s.phase.illum<<"%\n";
	}else{
		os<<"  phase n/a\n";
	}
	for(const auto&e : s.events){
		os<<"  event "<<e<<"\n";
	}
	os<<"  score="<<std::setprecision(2)<<s.score<<" outlook="
	  <<outlook_name(s.outlook)<<"\n";
	os.unsetf(std::ios::floatfield);
	os<<std::setprecision(6);
}

void batch_txt(std::ostream&os,const std::vector<BatchItem>&items,int tz_off){
	for(const auto&it : items){
		if(it.ok){
			snap_txt(os,it.snap,tz_off);
		}else{
			os<<"jd="<<std::setprecision(10)<<it.jd_utc<<" error="<<it.error
			  <<"\n";
			os<<std::setprecision(6);
		}
	}
}
