#pragma once

#include<iosfwd>
#include<string>
#include<vector>

#include "astro/batch.hpp"
#include "astro/js_writer.hpp"
#include "astro/snapshot.hpp"

extern const char*const SNAP_SCHEMA;

void wr_pos(JsonWriter&w,const BodyPosition&p);

void wr_aspect(JsonWriter&w,const AspectRecord&a);

void wr_snap(JsonWriter&w,const DailySnapshot&s);

void wr_meta(JsonWriter&w,const std::string&provider,const std::string&tz);

// One object with meta + data (a single snapshot)
void snap_json(std::ostream&os,const DailySnapshot&s,
			   const std::string&provider,const std::string&tz,bool pretty);

// meta + data array; failed instants are written as {jd_utc,error}
void batch_json(std::ostream&os,const std::vector<BatchItem>&items,
				const std::string&provider,const std::string&tz,bool pretty);

void snap_txt(std::ostream&os,const DailySnapshot&s,int tz_off);

void batch_txt(std::ostream&os,const std::vector<BatchItem>&items,int tz_off);
