#include<gtest/gtest.h>

#include<cstdio>
#include<filesystem>
#include<sstream>
#include<string>

#include "astro/config.hpp"
#include "astro/errors.hpp"

namespace fs=std::filesystem;

TEST(Config,EmptyStreamKeepsDefaults){
	EngineCfg cfg;
	std::istringstream is("");
	parse_cfg(is,"mem",cfg);
	EXPECT_DOUBLE_EQ(cfg.snap.aspect.orb(AspectType::SEXTILE),6.0);
	EXPECT_DOUBLE_EQ(cfg.snap.score.weight(AspectType::OPPOSITION),-8.0);
	EXPECT_TRUE(cfg.snap.score.is_major(AspectType::SQUARE));
	EXPECT_EQ(cfg.snap.bodies.size(),BODY_COUNT);
	EXPECT_EQ(cfg.tz,"Z");
	EXPECT_EQ(cfg.jobs,1);
}

TEST(Config,ParsesKeys){
	EngineCfg cfg;
	std::istringstream is(
		"# engine\n"
		"orb.square = 7.5\n"
		"weight.trine=3\n"
		"major=conjunction, trine\n"
		"\n"
		"bodies=Sun,Moon,Mars\n"
		"tz=+08:00\n"
		"jobs=4\n"
		"exact_eps=0.25\n"
		"bullish_at=70\n"
		"format=json\n"
		"bsp=/data/de440s.bsp\n");
	parse_cfg(is,"mem",cfg);
	EXPECT_DOUBLE_EQ(cfg.snap.aspect.orb(AspectType::SQUARE),7.5);
	EXPECT_DOUBLE_EQ(cfg.snap.score.weight(AspectType::TRINE),3.0);
	EXPECT_TRUE(cfg.snap.score.is_major(AspectType::TRINE));
	EXPECT_FALSE(cfg.snap.score.is_major(AspectType::SQUARE));
	ASSERT_EQ(cfg.snap.bodies.size(),3u);
	EXPECT_EQ(cfg.snap.bodies[2],Body::MARS);
	EXPECT_EQ(cfg.tz,"+08:00");
	EXPECT_EQ(cfg.jobs,4);
	EXPECT_DOUBLE_EQ(cfg.snap.aspect.exact_eps,0.25);
	EXPECT_DOUBLE_EQ(cfg.snap.score.bullish_at,70.0);
	EXPECT_EQ(cfg.def_fmt,"json");
	EXPECT_EQ(cfg.bsp,"/data/de440s.bsp");
}

TEST(Config,ErrorsCarryLineNumbers){
	EngineCfg cfg;
	std::istringstream is("tz=Z\ncolour=blue\n");
	try{
		parse_cfg(is,"astro_cfg.txt",cfg);
		FAIL()<<"expected ConfigError";
	}catch(const ConfigError&ex){
		std::string msg=ex.what();
		EXPECT_NE(msg.find("astro_cfg.txt:2"),std::string::npos);
		EXPECT_NE(msg.find("colour"),std::string::npos);
	}
}

TEST(Config,RejectsBadValues){
	EngineCfg cfg;
	EXPECT_THROW(apply_kv(cfg,"orb.square","wide"),ConfigError);
	EXPECT_THROW(apply_kv(cfg,"orb.quincunx","3"),ConfigError);
	EXPECT_THROW(apply_kv(cfg,"jobs","0"),ConfigError);
	EXPECT_THROW(apply_kv(cfg,"jobs","2.5"),ConfigError);
	EXPECT_THROW(apply_kv(cfg,"tz","+8"),ConfigError);
	EXPECT_THROW(apply_kv(cfg,"bodies","Sun,Vulcan"),ConfigError);
	EXPECT_THROW(apply_kv(cfg,"pretty","maybe"),ConfigError);
	EXPECT_THROW(apply_kv(cfg,"format","xml"),ConfigError);

	std::istringstream no_eq("orb.square 7\n");
	EXPECT_THROW(parse_cfg(no_eq,"mem",cfg),ConfigError);
}

TEST(Config,ValidatesAfterLoad){
	EngineCfg cfg;
	std::istringstream wide("orb.trine=45\n");
	EXPECT_THROW(parse_cfg(wide,"mem",cfg),ConfigError);

	EngineCfg thr;
	std::istringstream inv("bullish_at=30\nbearish_at=40\n");
	EXPECT_THROW(parse_cfg(inv,"mem",thr),ConfigError);
}

TEST(Config,ConfigErrorIsArgumentError){
	EngineCfg cfg;
	EXPECT_THROW(apply_kv(cfg,"nope","1"),std::invalid_argument);
}

TEST(Config,MissingFileIsNotAnError){
	EngineCfg cfg;
	EXPECT_FALSE(load_cfg("/nonexistent/dir/astro_cfg.txt",cfg));
	EXPECT_EQ(cfg.tz,"Z");
}

TEST(Config,SaveThenLoad){
	fs::path p=fs::temp_directory_path()/"astro_cfg_test.txt";
	EngineCfg out;
	apply_kv(out,"orb.opposition","9.5");
	apply_kv(out,"weight.square","-4.25");
	apply_kv(out,"major","opposition");
	apply_kv(out,"bodies","Moon,Sun");
	apply_kv(out,"tz","-05:00");
	apply_kv(out,"pretty","0");
	ASSERT_TRUE(save_cfg(p.string(),out));

	EngineCfg in;
	ASSERT_TRUE(load_cfg(p.string(),in));
	std::remove(p.string().c_str());

	EXPECT_DOUBLE_EQ(in.snap.aspect.orb(AspectType::OPPOSITION),9.5);
	EXPECT_DOUBLE_EQ(in.snap.score.weight(AspectType::SQUARE),-4.25);
	EXPECT_TRUE(in.snap.score.is_major(AspectType::OPPOSITION));
	EXPECT_FALSE(in.snap.score.is_major(AspectType::CONJUNCTION));
	ASSERT_EQ(in.snap.bodies.size(),2u);
	EXPECT_EQ(in.snap.bodies[0],Body::MOON);
	EXPECT_EQ(in.tz,"-05:00");
	EXPECT_FALSE(in.pretty);
	EXPECT_DOUBLE_EQ(in.snap.jd_min,out.snap.jd_min);
}

TEST(Config,TrimStripsWhitespace){
	EXPECT_EQ(trim("  a b \t"),"a b");
	EXPECT_EQ(trim(""),"");
}
