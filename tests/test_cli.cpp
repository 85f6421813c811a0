#include<gtest/gtest.h>

#include<cstdio>
#include<cstdlib>
#include<fstream>
#include<iostream>
#include<sstream>
#include<stdexcept>
#include<string>
#include<vector>

#include "graha/cli.hpp"

namespace{

// Redirects std::cout while alive.
class CoutCap{
  public:
	CoutCap() : old_(std::cout.rdbuf(buf_.rdbuf())){}
	~CoutCap(){ std::cout.rdbuf(old_); }

	std::string str() const{ return buf_.str(); }

  private:
	std::ostringstream buf_;
	std::streambuf*old_;
};

bool has(const std::string&text,const std::string&part){
	return text.find(part)!=std::string::npos;
}

std::string read_all(const std::string&path){
	std::ifstream ifs(path);
	std::stringstream ss;
	ss<<ifs.rdbuf();
	return ss.str();
}

// Each test runs against its own config file, so no kernel is configured
// and the mean-element model serves every position.
class Cli : public ::testing::Test{
  protected:
	void SetUp() override{
		cfg_=::testing::TempDir()+"graha_cli_test.cfg";
		std::remove(cfg_.c_str());
		setenv("GRAHA_CFG",cfg_.c_str(),1);
	}

	void TearDown() override{
		unsetenv("GRAHA_CFG");
		std::remove(cfg_.c_str());
	}

	std::string run(const std::vector<std::string>&args,int want=0){
		CoutCap cap;
		EXPECT_EQ(run_cli(args),want);
		return cap.str();
	}

	std::string cfg_;
};

}

TEST_F(Cli,VersionAndHelp){
	EXPECT_EQ(run({"--version"}),tool_ver()+"\n");
	EXPECT_TRUE(has(run({}),"Usage:"));
	EXPECT_TRUE(has(run({"positions","--help"}),"graha positions <datetime>"));
}

TEST_F(Cli,PositionsText){
	std::string out=run({"--quiet","positions","2000-01-01T12:00:00Z"});
	EXPECT_EQ(out.rfind("tool=graha format=txt type=positions\n",0),0u);
	EXPECT_TRUE(has(out,"data.frame=tropical\n"));
	EXPECT_TRUE(has(out,"data.accuracy=approximate\n"));
	EXPECT_TRUE(has(out,"data.ascendant=unavailable\n"));
	EXPECT_TRUE(has(out,"Moon"));
	EXPECT_TRUE(has(out,"Ketu"));
}

TEST_F(Cli,PositionsWithLocationAndSiderealFrame){
	std::string out=run({"--quiet","positions","2000-01-01T12:00:00Z",
						 "--frame","sidereal","--lat","51.5","--lon","-0.1"});
	EXPECT_TRUE(has(out,"data.frame=sidereal\n"));
	EXPECT_TRUE(has(out,"data.ayanamsha="));
	EXPECT_FALSE(has(out,"data.ascendant=unavailable"));
	EXPECT_TRUE(has(out," house="));
}

TEST_F(Cli,PositionsJson){
	std::string out=run({"--quiet","positions","2000-01-01T12:00:00Z",
						 "--format","json","--pretty","0"});
	EXPECT_EQ(out.rfind("{\"meta\":{\"tool\":\"graha\"",0),0u);
	EXPECT_TRUE(has(out,"\"type\":\"positions\""));
	EXPECT_TRUE(has(out,"\"data\":{\"time\":"));
	EXPECT_TRUE(has(out,"\"ascendant\":null"));
	EXPECT_TRUE(has(out,"\"moon\":{\"longitude\":"));
	EXPECT_EQ(out.back(),'\n');
}

TEST_F(Cli,OutputFile){
	std::string path=::testing::TempDir()+"graha_cli_out.txt";
	std::remove(path.c_str());
	std::string out=run({"--quiet","nakshatra","20","--out",path});
	EXPECT_TRUE(out.empty());
	std::string file=read_all(path);
	EXPECT_EQ(file.rfind("tool=graha format=txt type=nakshatra\n",0),0u);
	EXPECT_TRUE(has(file,"data.name=Bharani\n"));
	EXPECT_TRUE(has(file,"data.pada=3\n"));
	std::remove(path.c_str());
}

TEST_F(Cli,DashaAndStrength){
	std::string out=run({"--quiet","dasha","1990-05-15T08:30:00Z","--lat",
						 "19.07","--lon","72.88","--depth","1","--format",
						 "json","--pretty","0"});
	EXPECT_TRUE(has(out,"\"type\":\"dasha\""));
	EXPECT_TRUE(has(out,"\"tree\":"));

	out=run({"--quiet","dasha","1990-05-15T08:30:00Z","--lat","19.07","--lon",
			 "72.88","--at","2000-01-01T00:00:00Z","--format","json","--pretty",
			 "0"});
	EXPECT_TRUE(has(out,"\"active\":"));

	out=run({"--quiet","strength","1990-05-15T08:30:00Z","--lat","19.07",
			 "--lon","72.88"});
	EXPECT_TRUE(has(out,"type=strength\n"));
	EXPECT_TRUE(has(out,"data.frame=sidereal\n"));
}

TEST_F(Cli,AspectsAndPulse){
	std::string out=run({"--quiet","aspects","2000-01-01T12:00:00Z"});
	EXPECT_TRUE(has(out,"data.mode=chart\n"));
	EXPECT_TRUE(has(out,"pulse.label="));

	out=run({"--quiet","aspects","2000-01-01T12:00:00Z",
			 "1990-05-15T08:30:00Z"});
	EXPECT_TRUE(has(out,"data.mode=synastry\n"));

	out=run({"--quiet","pulse","1990-05-15T08:30:00Z","--from",
			 "2024-01-01T00:00:00Z","--days","3","--format","json","--pretty",
			 "0"});
	EXPECT_TRUE(has(out,"\"type\":\"pulse\""));
	EXPECT_TRUE(has(out,"\"days\":[{\"date\":\"2024-01-01\",\"intensity\":"));
	EXPECT_TRUE(has(out,"\"peak_windows\":["));
	EXPECT_TRUE(has(out,"\"next_shift\":{\"date\":"));
}

TEST_F(Cli,ConfigSetAndShow){
	run({"--quiet","config","--set","cache_size=32","--set",
		 "default_tz=+05:30"});
	std::string file=read_all(cfg_);
	EXPECT_TRUE(has(file,"cache_size=32"));

	std::string out=run({"--quiet","config"});
	EXPECT_TRUE(has(out,"file="+cfg_+"\n"));
	EXPECT_TRUE(has(out,"cache_size=32\n"));
	EXPECT_TRUE(has(out,"default_tz=+05:30\n"));

	EXPECT_THROW(run_cli({"--quiet","config","--set","nope=1"}),
				 std::invalid_argument);
	EXPECT_THROW(run_cli({"--quiet","config","--set","cache_size"}),
				 std::invalid_argument);
}

TEST_F(Cli,RejectsBadArguments){
	EXPECT_THROW(run_cli({"bogus"}),std::invalid_argument);
	EXPECT_THROW(run_cli({"positions","2000-01-01T12:00:00Z","--bogus"}),
				 std::invalid_argument);
	EXPECT_THROW(run_cli({"positions","--frame"}),std::invalid_argument);
	EXPECT_THROW(run_cli({"--quiet","positions","2000-01-01T12:00:00Z",
						  "--frame","galactic"}),
				 std::invalid_argument);
	EXPECT_THROW(run_cli({"positions","2000-01-01T12:00:00Z","--lat","10"}),
				 std::invalid_argument);
	EXPECT_THROW(run_cli({"positions","2000-01-01T12:00:00Z","--format",
						  "xml"}),
				 std::invalid_argument);
	EXPECT_THROW(run_cli({"nakshatra","abc"}),std::invalid_argument);
	EXPECT_THROW(run_cli({"dasha","1990-05-15T08:30:00Z"}),
				 std::invalid_argument);
	EXPECT_THROW(run_cli({"dasha","1990-05-15T08:30:00Z","--lat","1","--lon",
						  "1","--depth","9"}),
				 std::invalid_argument);
	EXPECT_THROW(run_cli({"pulse","1990-05-15T08:30:00Z"}),
				 std::invalid_argument);
	EXPECT_THROW(run_cli({"--quiet","positions","9000-01-01T00:00:00Z"}),
				 std::out_of_range);
}

TEST_F(Cli,ExitCodes){
	std::ostringstream err;
	{
		CoutCap cap;
		EXPECT_EQ(run_main({"--version"},err),0);
	}
	EXPECT_TRUE(err.str().empty());

	EXPECT_EQ(run_main({"bogus"},err),2);
	EXPECT_TRUE(has(err.str(),"argument error: unknown command: bogus"));

	err.str("");
	EXPECT_EQ(run_main({"--quiet","positions","9000-01-01T00:00:00Z"},err),3);
	EXPECT_EQ(err.str().rfind("range error: ",0),0u);

	err.str("");
	EXPECT_EQ(run_main({"--quiet","positions","--file",
						::testing::TempDir()+"no_such_dir/list.txt"},
					   err),
			  1);
	EXPECT_TRUE(has(err.str(),"error: failed to open input file"));
}
