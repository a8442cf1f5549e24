#pragma once

#include<string>
#include<vector>

#include "astro/config.hpp"

// Options shared by every engine command. Empty strings and negative
// numbers mean "not given"; the config file fills those in.
struct CommonArgs{
	std::string cfg_path;
	std::string bsp;
	std::string table;
	std::string tz;
	std::string format;
	std::string out;
	int pretty=-1;
	int jobs=0;
	bool quiet=false;
};

EngineCfg res_cfg(const CommonArgs&args);

struct SnapArgs{
	CommonArgs common;
	std::vector<std::string> instants;
	std::string input_file;
};

int cli_snap(const SnapArgs&args);

struct RangeArgs{
	CommonArgs common;
	std::string start;
	std::string end;
	double step=1.0;
};

int cli_range(const RangeArgs&args);

int cmd_snap(const std::vector<std::string>&args);
int cmd_range(const std::vector<std::string>&args);
int cmd_test(const std::vector<std::string>&args);
int cmd_cfg(const std::vector<std::string>&args);

std::string tool_ver();

void use_main();
void use_snap();
void use_range();
void use_test();
void use_cfg();
