#include "graha/js_writer.hpp"

#include<cmath>
#include<cstdio>
#include<iomanip>
#include<ostream>
#include<sstream>
#include<stdexcept>

std::string js_escape(const std::string&s){
	std::string out;
	out.reserve(s.size()+2);
	for(unsigned char c : s){
		switch(c){
		case '"':
			out+="\\\"";
			break;
		case '\\':
			out+="\\\\";
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
				char buf[8];
				std::snprintf(buf,sizeof(buf),"\\u%04x",static_cast<int>(c));
				out+=buf;
			}else{
				out+=static_cast<char>(c);
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
	os_<<'\n'<<std::string(stack_.size()*static_cast<std::size_t>(ind_size_),
						   ' ');
}

void JsonWriter::pre_value(){
	if(stack_.empty()){
		if(root_done_){
			throw std::logic_error("multiple JSON roots");
		}
		root_done_=true;
		return;
	}
	Scope&sc=stack_.back();
	if(sc.is_obj){
		if(!sc.want_val){
			throw std::logic_error("value in object requires key()");
		}
		sc.want_val=false;
		return;
	}
	if(!sc.first){
		os_<<',';
	}
	sc.first=false;
	newline();
}

void JsonWriter::close(bool is_obj,char ch){
	if(stack_.empty()||stack_.back().is_obj!=is_obj){
		throw std::logic_error(is_obj?"obj_end without obj_begin":
									  "arr_end without arr_begin");
	}
	Scope sc=stack_.back();
	if(sc.want_val){
		throw std::logic_error("object key missing value");
	}
	stack_.pop_back();
	if(!sc.first){
		newline();
	}
	os_<<ch;
}

void JsonWriter::obj_begin(){
	pre_value();
	os_<<'{';
	stack_.push_back({true,true,false});
}

void JsonWriter::obj_end(){ close(true,'}'); }

void JsonWriter::arr_begin(){
	pre_value();
	os_<<'[';
	stack_.push_back({false,true,false});
}

void JsonWriter::arr_end(){ close(false,']'); }

void JsonWriter::key(const std::string&name){
	if(stack_.empty()||!stack_.back().is_obj){
		throw std::logic_error("key() outside object");
	}
	Scope&sc=stack_.back();
	if(sc.want_val){
		throw std::logic_error("previous key missing value");
	}
	if(!sc.first){
		os_<<',';
	}
	sc.first=false;
	newline();
	os_<<'"'<<js_escape(name)<<"\":";
	if(pretty_){
		os_<<' ';
	}
	sc.want_val=true;
}

void JsonWriter::value(const std::string&v){
	pre_value();
	os_<<'"'<<js_escape(v)<<'"';
}

void JsonWriter::value(const char*v){ value(std::string(v==nullptr?"":v)); }

void JsonWriter::value(double v){
	if(!std::isfinite(v)){
		null_val();
		return;
	}
	pre_value();
	std::ostringstream oss;
	oss<<std::setprecision(15)<<v;
	os_<<oss.str();
}

void JsonWriter::value(int v){
	pre_value();
	os_<<v;
}

void JsonWriter::value(long long v){
	pre_value();
	os_<<v;
}

void JsonWriter::value(bool v){
	pre_value();
	os_<<(v?"true":"false");
}

void JsonWriter::null_val(){
	pre_value();
	os_<<"null";
}

void JsonWriter::fixed(double v,int digits){
	if(!std::isfinite(v)){
		null_val();
		return;
	}
	pre_value();
	std::ostringstream oss;
	oss<<std::fixed<<std::setprecision(digits)<<v;
	os_<<oss.str();
}

void JsonWriter::opt_field(const std::string&name,
						   const std::optional<double>&v){
	key(name);
	if(v){
		value(*v);
	}else{
		null_val();
	}
}

void JsonWriter::str_arr(const std::string&name,
						 const std::vector<std::string>&items){
	key(name);
	arr_begin();
	for(const auto&s : items){
		value(s);
	}
	arr_end();
}
