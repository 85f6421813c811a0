#pragma once

#include<iosfwd>
#include<optional>
#include<string>
#include<vector>

std::string js_escape(const std::string&s);

// Streaming JSON emitter; misuse (value without key, unbalanced ends) throws
// std::logic_error.
class JsonWriter{
  public:
	explicit JsonWriter(std::ostream&os,bool pretty=true,int ind_size=2);

	void obj_begin();
	void obj_end();
	void arr_begin();
	void arr_end();

	void key(const std::string&name);

	void value(const std::string&v);
	void value(const char*v);
	// non-finite numbers are written as null
	void value(double v);
	void value(int v);
	void value(long long v);
	void value(bool v);
	void null_val();

	// rounded to digits after the decimal point
	void fixed(double v,int digits);

	template<class T> void field(const std::string&name,const T&v){
		key(name);
		value(v);
	}

	void opt_field(const std::string&name,const std::optional<double>&v);

	void str_arr(const std::string&name,const std::vector<std::string>&items);

  private:
	struct Scope{
		bool is_obj=false;
		bool first=true;
		bool want_val=false;
	};

	std::ostream&os_;
	bool pretty_=true;
	int ind_size_=2;
	bool root_done_=false;
	std::vector<Scope> stack_;

	void newline();
	void pre_value();
	void close(bool is_obj,char ch);
};
