#include "astro/cli.hpp"

#include<exception>
#include<iostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace{

std::vector<std::string> col_args(int argc,char**argv){
	std::vector<std::string> out;
	out.reserve(argc>1?static_cast<std::size_t>(argc-1):0);
	for(int i=1;i<argc;++i){
		out.emplace_back(argv[i]);
	}
	return out;
}

}

int main(int argc,char**argv){
	try{
		if(argc<=1){
			use_main();
			return 2;
		}

		std::vector<std::string> args=col_args(argc,argv);
		const std::string&first=args[0];
		std::vector<std::string> rest(args.begin()+1,args.end());

		if(first=="-h"||first=="--help"){
			use_main();
			return 0;
		}
		if(first=="--version"){
			std::cout<<tool_ver()<<std::endl;
			return 0;
		}

		if(first=="snapshot"){
			return cmd_snap(rest);
		}
		if(first=="range"){
			return cmd_range(rest);
		}
		if(first=="selftest"){
			return cmd_test(rest);
		}
		if(first=="config"){
			return cmd_cfg(rest);
		}

		throw std::invalid_argument("unknown command: "+first);

	}catch(const std::invalid_argument&ex){
		std::cerr<<"argument error: "<<ex.what()<<std::endl;
		return 2;
	}catch(const std::exception&ex){
		std::cerr<<"error: "<<ex.what()<<std::endl;
		return 1;
	}
}
