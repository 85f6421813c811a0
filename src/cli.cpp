#include "graha/cli.hpp"
#include "graha/cli_common.hpp"

#include<exception>
#include<fstream>
#include<functional>
#include<iostream>
#include<optional>
#include<stdexcept>
#include<unordered_map>
#include<utility>

#include "graha/aspects.hpp"
#include "graha/batch.hpp"
#include "graha/dasha.hpp"
#include "graha/ephem.hpp"
#include "graha/format.hpp"
#include "graha/instant.hpp"
#include "graha/js_writer.hpp"
#include "graha/nakshatra.hpp"
#include "graha/report.hpp"
#include "graha/strength.hpp"

namespace{

using cli_util::OutTgt;
using cli_util::chk_fmt;
using cli_util::is_opt;
using cli_util::note_out;
using cli_util::open_out;
using cli_util::parse_bool01;
using cli_util::parse_int;
using cli_util::parse_num;
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

// Positional arguments are collected in order, options go through handlers.
// Returns false when help was requested.
bool parse_args(const OptMap&handlers,const std::vector<std::string>&args,
				std::vector<std::string>&pos,const std::string&ctx,
				const std::function<void()>&usage){
	for(std::size_t i=0;i<args.size();++i){
		const std::string&a=args[i];
		if(a=="-h"||a=="--help"){
			usage();
			return false;
		}
		if(is_opt(a)){
			apply_opt(handlers,args,i,a,ctx);
		}else{
			pos.push_back(a);
		}
	}
	return true;
}

// --format/--out/--pretty/--tz shared by every computing command
template<class A> void out_opts(OptMap&h,A&a){
	h["--format"]=[&](const std::vector<std::string>&src,std::size_t&idx,
					  const std::string&opt){
		a.format=to_low(req_val(src,idx,opt));
	};
	h["--out"]=[&](const std::vector<std::string>&src,std::size_t&idx,
				   const std::string&opt){ a.out=req_val(src,idx,opt); };
	h["--pretty"]=[&](const std::vector<std::string>&src,std::size_t&idx,
					  const std::string&opt){
		a.pretty=parse_bool01(req_val(src,idx,opt),"--pretty");
	};
	h["--tz"]=[&](const std::vector<std::string>&src,std::size_t&idx,
				  const std::string&opt){ a.tz=req_val(src,idx,opt); };
}

template<class A> void out_defs(const AppCtx&app,A&a){
	if(a.tz.empty()){
		a.tz=app.cfg.default_tz;
	}
	if(a.format.empty()){
		a.format=app.cfg.def_fmt;
	}
}

// Renders either format to the output target.
void emit(const std::string&format,const std::string&out_path,bool pretty,
		  bool quiet,const std::string&type,const std::string&ephem,
		  const std::function<void(std::ostream&)>&txt,
		  const std::function<void(JsonWriter&)>&json){
	chk_fmt(format,{"json","txt"},type);
	OutTgt out=open_out(out_path);
	if(format=="json"){
		JsonWriter w(out.os(),pretty);
		w.obj_begin();
		write_meta(w,type,ephem);
		w.key("data");
		json(w);
		w.obj_end();
		out.os()<<"\n";
	}else{
		txt_head(out.os(),type);
		txt(out.os());
	}
	note_out(out_path,quiet);
}

double jd_of(const std::string&text,const std::string&tz){
	return parse_iso(text,tz).jd_utc;
}

struct Natal{
	BirthCtx ctx;
	Instant in;
};

Natal read_birth(AppCtx&app,const std::string&raw,double lat,double lon,
				 const std::string&tz){
	Natal n;
	n.ctx=parse_birth(raw,lat,lon,tz);
	n.in=birth_instant(n.ctx);
	if(!n.ctx.has_time()&&app.log()){
		*app.log()<<"note: birth time unknown; using local noon, houses "
					"and directional strength unavailable"
				  <<std::endl;
	}
	return n;
}

void need_loc(bool has_lat,bool has_lon,const std::string&ctx){
	if(!has_lat||!has_lon){
		throw std::invalid_argument(ctx+" requires --lat and --lon");
	}
}

ChartCtx chart_of(AppCtx&app,const Natal&n,Frame frame){
	ChartCtx c;
	if(n.ctx.has_time()){
		c.asc=app.prov().ascendant(n.in,frame);
	}
	return c;
}

std::vector<PosTask> read_tasks(const std::string&path,const std::string&tz,
								std::vector<std::string>&errors){
	std::ifstream ifs(path,std::ios::binary);
	if(!ifs){
		throw std::runtime_error("failed to open input file: "+path);
	}
	std::vector<PosTask> tasks;
	std::string raw;
	int line_no=0;
	while(std::getline(ifs,raw)){
		++line_no;
		std::string line=trim(raw);
		if(line.empty()||line[0]=='#'){
			continue;
		}
		PosTask t;
		t.line_no=line_no;
		t.raw=line;
		try{
			t.jd_utc=jd_of(line,tz);
		}catch(const std::invalid_argument&ex){
			errors.push_back("line "+std::to_string(line_no)+": "+ex.what());
			continue;
		}
		tasks.push_back(t);
	}
	return tasks;
}

int cli_batch(AppCtx&app,const PosArgs&args,Frame frame){
	std::vector<std::string> parse_err;
	std::vector<PosTask> tasks=read_tasks(args.input_file,args.tz,parse_err);
	if(tasks.empty()&&parse_err.empty()){
		throw std::invalid_argument("batch input is empty");
	}
	std::vector<PosSet> results;
	std::vector<std::string> errors;
	run_batch(app.prov(),frame,tasks,results,errors,args.jobs);

	std::size_t err_cnt=parse_err.size();
	for(const auto&e : errors){
		if(!e.empty()){
			++err_cnt;
		}
	}
	emit(
		args.format,args.out,args.pretty,app.quiet,"positions_batch",
		app.ephem_label(),
		[&](std::ostream&os){
			for(const auto&e : parse_err){
				os<<"error "<<e<<"\n";
			}
			for(std::size_t i=0;i<tasks.size();++i){
				os<<"line="<<tasks[i].line_no<<" input="<<tasks[i].raw<<"\n";
				if(!errors[i].empty()){
					os<<"error="<<errors[i]<<"\n";
					continue;
				}
				pos_txt(os,results[i],std::nullopt,args.tz);
			}
		},
		[&](JsonWriter&w){
			w.obj_begin();
			w.str_arr("parse_errors",parse_err);
			w.key("rows");
			w.arr_begin();
			for(std::size_t i=0;i<tasks.size();++i){
				w.obj_begin();
				w.field("line",tasks[i].line_no);
				w.field("input",tasks[i].raw);
				w.field("ok",errors[i].empty());
				if(errors[i].empty()){
					w.key("positions");
					pos_json(w,results[i],std::nullopt,args.tz);
				}else{
					w.field("error",errors[i]);
				}
				w.obj_end();
			}
			w.arr_end();
			w.obj_end();
		});
	return err_cnt==0?0:1;
}

}

GlobalOpts take_global(std::vector<std::string>&args){
	GlobalOpts g;
	std::vector<std::string> rest;
	for(std::size_t i=0;i<args.size();++i){
		if(args[i]=="--ephem"){
			g.ephem=req_val(args,i,"--ephem");
			g.has_ephem=true;
		}else if(args[i]=="--quiet"){
			g.quiet=true;
		}else{
			rest.push_back(args[i]);
		}
	}
	args.swap(rest);
	return g;
}

AppCtx::AppCtx(const GlobalOpts&g) : cfg_file(cfg_path()),quiet(g.quiet){
	bool found=load_cfg(cfg,cfg_file);
	if(found&&log()){
		*log()<<"config: "<<cfg_file<<std::endl;
	}
	if(g.has_ephem){
		cfg.ephem=g.ephem;
	}
}

AppCtx::~AppCtx()=default;

std::ostream*AppCtx::log() const{ return quiet?nullptr:&std::cerr; }

EphProvider&AppCtx::prov(){
	if(!prov_){
		EphOpts o;
		o.kernel=cfg.ephem;
		o.cache_size=cfg.cache_size;
		o.cache_res_sec=cfg.cache_res_sec;
		prov_=open_src(o,log());
	}
	return *prov_;
}

std::string AppCtx::ephem_label() const{
	if(!prov_){
		return cfg.ephem;
	}
	return prov_->primary().name();
}

void cli_pos(AppCtx&app,const PosArgs&args){
	Frame frame=parse_frame(args.frame);
	IsoTime t=parse_iso(args.time_raw,args.tz);
	PosSet ps=app.prov().positions(t.jd_utc,frame);
	std::optional<double> asc;
	if(args.has_loc){
		Instant in=mk_instant(t.jd_utc,args.lat,args.lon,args.tz);
		asc=app.prov().ascendant(in,frame);
	}
	emit(
		args.format,args.out,args.pretty,app.quiet,"positions",
		app.ephem_label(),
		[&](std::ostream&os){ pos_txt(os,ps,asc,args.tz); },
		[&](JsonWriter&w){ pos_json(w,ps,asc,args.tz); });
}

void cli_dasha(AppCtx&app,const DashaArgs&args){
	need_loc(args.has_lat,args.has_lon,"dasha");
	if(args.depth<1||args.depth>DASHA_MAX_LEVEL){
		throw std::invalid_argument("--depth must be 1..5");
	}
	Natal n=read_birth(app,args.birth_raw,args.lat,args.lon,args.tz);
	PosSet ps=app.prov().positions(n.in,Frame::SIDEREAL);
	double until=args.until.empty()?
					 n.in.jd_utc+DASHA_CYCLE_YEARS*JUL_YEAR:
					 jd_of(args.until,args.tz);
	DashaTree tree=assemble(n.in.jd_utc,ps.at(Body::MOON).lon,until,
							args.depth);

	std::vector<DashaTrans> tr;
	std::optional<ImpactCmp> cmp;
	if(!args.at.empty()){
		double at=jd_of(args.at,args.tz);
		tr=transitions(tree,at);
		if(!tr.empty()&&tr.front().has_next){
			StrengthSet ss=score(ps,chart_of(app,n,Frame::SIDEREAL),
								 app.cfg.strength);
			cmp=cmp_impact(tr.front().lord,tr.front().next_lord,ss,
						   app.cfg.strength);
		}
	}

	emit(
		args.format,args.out,args.pretty,app.quiet,"dasha",app.ephem_label(),
		[&](std::ostream&os){
			os<<"data.accuracy="<<acc_name(ps.acc)<<"\n";
			dasha_txt(os,tree,args.tz);
			trans_txt(os,tr,args.tz);
			if(cmp){
				impact_txt(os,*cmp);
			}
		},
		[&](JsonWriter&w){
			w.obj_begin();
			w.field("accuracy",acc_name(ps.acc));
			w.key("tree");
			dasha_json(w,tree,args.tz);
			if(!args.at.empty()){
				w.key("active");
				trans_json(w,tr,args.tz);
			}
			if(cmp){
				w.key("impact");
				impact_json(w,*cmp);
			}
			w.obj_end();
		});
}

void cli_str(AppCtx&app,const StrArgs&args){
	need_loc(args.has_lat,args.has_lon,"strength");
	Frame frame=parse_frame(args.frame);
	Natal n=read_birth(app,args.birth_raw,args.lat,args.lon,args.tz);
	PosSet ps=app.prov().positions(n.in,frame);
	ChartCtx ctx=chart_of(app,n,frame);
	StrengthSet ss=score(ps,ctx,app.cfg.strength);
	emit(
		args.format,args.out,args.pretty,app.quiet,"strength",
		app.ephem_label(),
		[&](std::ostream&os){
			os<<"data.frame="<<frame_name(frame)<<"\n";
			os<<"data.accuracy="<<acc_name(ps.acc)<<"\n";
			str_txt(os,ss);
		},
		[&](JsonWriter&w){
			w.obj_begin();
			w.field("frame",frame_name(frame));
			w.field("accuracy",acc_name(ps.acc));
			w.key("scores");
			str_json(w,ss);
			w.obj_end();
		});
}

void cli_asp(AppCtx&app,const AspArgs&args){
	Frame frame=parse_frame(args.frame);
	PosSet a=app.prov().positions(jd_of(args.times[0],args.tz),frame);
	std::vector<AspectEvent> evs;
	if(args.times.size()==1){
		evs=chart_aspects(a,app.cfg.orbs);
	}else{
		PosSet b=app.prov().positions(jd_of(args.times[1],args.tz),frame);
		evs=find_aspects(a,b,app.cfg.orbs);
	}
	Pulse p=pulse(evs,app.cfg.pulse);
	emit(
		args.format,args.out,args.pretty,app.quiet,"aspects",app.ephem_label(),
		[&](std::ostream&os){
			os<<"data.mode="<<(args.times.size()==1?"chart":"synastry")<<"\n";
			asp_txt(os,evs,args.tz);
			pulse_txt(os,p,"pulse.");
		},
		[&](JsonWriter&w){
			w.obj_begin();
			w.field("mode",args.times.size()==1?"chart":"synastry");
			w.key("aspects");
			asp_json(w,evs,args.tz);
			w.key("pulse");
			pulse_json(w,p);
			w.obj_end();
		});
}

void cli_trans(AppCtx&app,const TransArgs&args){
	Frame frame=parse_frame(args.frame);
	double birth=jd_of(args.birth_raw,args.tz);
	double from=jd_of(args.from,args.tz);
	double to=jd_of(args.to,args.tz);
	PosSet natal=app.prov().positions(birth,frame);
	std::vector<AspectEvent> evs=
		scan_window(app.prov(),natal,from,to,frame,app.cfg.orbs,args.step);
	emit(
		args.format,args.out,args.pretty,app.quiet,"transits",
		app.ephem_label(),
		[&](std::ostream&os){
			os<<"input.from="<<cli_util::fmt_at(from,args.tz)<<"\n";
			os<<"input.to="<<cli_util::fmt_at(to,args.tz)<<"\n";
			asp_txt(os,evs,args.tz);
		},
		[&](JsonWriter&w){
			w.obj_begin();
			w.field("from",cli_util::fmt_at(from,args.tz));
			w.field("to",cli_util::fmt_at(to,args.tz));
			w.key("events");
			asp_json(w,evs,args.tz);
			w.obj_end();
		});
}

void cli_pulse(AppCtx&app,const PulseArgs&args){
	Frame frame=parse_frame(args.frame);
	double birth=jd_of(args.birth_raw,args.tz);
	double from=jd_of(args.from,args.tz);
	PosSet natal=app.prov().positions(birth,frame);
	std::vector<DayPulse> days=daily_pulse(app.prov(),natal,from,args.days,
										   app.cfg.orbs,app.cfg.pulse);
	std::vector<PeakWindow> peaks=peak_windows(days);
	Shift sh=next_shift(days);
	emit(
		args.format,args.out,args.pretty,app.quiet,"pulse",app.ephem_label(),
		[&](std::ostream&os){ dpulse_txt(os,days,peaks,sh,args.tz); },
		[&](JsonWriter&w){ dpulse_json(w,days,peaks,sh,args.tz); });
}

int cmd_pos(AppCtx&app,const std::vector<std::string>&args){
	PosArgs a;
	a.pretty=app.cfg.def_pretty;
	bool has_lat=false;
	bool has_lon=false;
	OptMap h={
		{"--frame",[&](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){
			 a.frame=to_low(req_val(src,idx,opt));
		 }},
		{"--lat",[&](const std::vector<std::string>&src,std::size_t&idx,
					 const std::string&opt){
			 a.lat=parse_num(req_val(src,idx,opt),"--lat");
			 has_lat=true;
		 }},
		{"--lon",[&](const std::vector<std::string>&src,std::size_t&idx,
					 const std::string&opt){
			 a.lon=parse_num(req_val(src,idx,opt),"--lon");
			 has_lon=true;
		 }},
		{"--file",[&](const std::vector<std::string>&src,std::size_t&idx,
					  const std::string&opt){
			 a.input_file=req_val(src,idx,opt);
		 }},
		{"--jobs",[&](const std::vector<std::string>&src,std::size_t&idx,
					  const std::string&opt){
			 a.jobs=parse_int(req_val(src,idx,opt),"--jobs");
			 if(a.jobs<1){
				 throw std::invalid_argument("--jobs must be >= 1");
			 }
		 }},
	};
	out_opts(h,a);
	std::vector<std::string> pos;
	if(!parse_args(h,args,pos,"positions",use_pos)){
		return 0;
	}
	out_defs(app,a);
	if(has_lat!=has_lon){
		throw std::invalid_argument("--lat and --lon go together");
	}
	a.has_loc=has_lat&&has_lon;
	if(!a.input_file.empty()){
		if(!pos.empty()){
			throw std::invalid_argument(
				"positions takes either <datetime> or --file");
		}
		return cli_batch(app,a,parse_frame(a.frame));
	}
	if(pos.size()!=1){
		throw std::invalid_argument("positions requires: <datetime>");
	}
	a.time_raw=pos[0];
	cli_pos(app,a);
	return 0;
}

int cmd_nak(AppCtx&app,const std::vector<std::string>&args){
	std::string format=app.cfg.def_fmt;
	std::string out_path;
	bool pretty=app.cfg.def_pretty;
	OptMap h={
		{"--format",[&](const std::vector<std::string>&src,std::size_t&idx,
						const std::string&opt){
			 format=to_low(req_val(src,idx,opt));
		 }},
		{"--out",[&](const std::vector<std::string>&src,std::size_t&idx,
					 const std::string&opt){ out_path=req_val(src,idx,opt); }},
		{"--pretty",[&](const std::vector<std::string>&src,std::size_t&idx,
						const std::string&opt){
			 pretty=parse_bool01(req_val(src,idx,opt),"--pretty");
		 }},
	};
	std::vector<std::string> pos;
	if(!parse_args(h,args,pos,"nakshatra",use_nak)){
		return 0;
	}
	if(pos.size()!=1){
		throw std::invalid_argument("nakshatra requires: <sidereal-longitude>");
	}
	NakInfo n=nakshatra(parse_num(pos[0],"longitude"));
	emit(
		format,out_path,pretty,app.quiet,"nakshatra","",
		[&](std::ostream&os){ nak_txt(os,n); },
		[&](JsonWriter&w){ nak_json(w,n); });
	return 0;
}

int cmd_dasha(AppCtx&app,const std::vector<std::string>&args){
	DashaArgs a;
	a.pretty=app.cfg.def_pretty;
	OptMap h={
		{"--lat",[&](const std::vector<std::string>&src,std::size_t&idx,
					 const std::string&opt){
			 a.lat=parse_num(req_val(src,idx,opt),"--lat");
			 a.has_lat=true;
		 }},
		{"--lon",[&](const std::vector<std::string>&src,std::size_t&idx,
					 const std::string&opt){
			 a.lon=parse_num(req_val(src,idx,opt),"--lon");
			 a.has_lon=true;
		 }},
		{"--until",[&](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){ a.until=req_val(src,idx,opt); }},
		{"--depth",[&](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){
			 a.depth=parse_int(req_val(src,idx,opt),"--depth");
		 }},
		{"--at",[&](const std::vector<std::string>&src,std::size_t&idx,
					const std::string&opt){ a.at=req_val(src,idx,opt); }},
	};
	out_opts(h,a);
	std::vector<std::string> pos;
	if(!parse_args(h,args,pos,"dasha",use_dasha)){
		return 0;
	}
	out_defs(app,a);
	if(pos.size()!=1){
		throw std::invalid_argument("dasha requires: <birth-datetime>");
	}
	a.birth_raw=pos[0];
	cli_dasha(app,a);
	return 0;
}

int cmd_str(AppCtx&app,const std::vector<std::string>&args){
	StrArgs a;
	a.pretty=app.cfg.def_pretty;
	OptMap h={
		{"--lat",[&](const std::vector<std::string>&src,std::size_t&idx,
					 const std::string&opt){
			 a.lat=parse_num(req_val(src,idx,opt),"--lat");
			 a.has_lat=true;
		 }},
		{"--lon",[&](const std::vector<std::string>&src,std::size_t&idx,
					 const std::string&opt){
			 a.lon=parse_num(req_val(src,idx,opt),"--lon");
			 a.has_lon=true;
		 }},
		{"--frame",[&](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){
			 a.frame=to_low(req_val(src,idx,opt));
		 }},
	};
	out_opts(h,a);
	std::vector<std::string> pos;
	if(!parse_args(h,args,pos,"strength",use_str)){
		return 0;
	}
	out_defs(app,a);
	if(pos.size()!=1){
		throw std::invalid_argument("strength requires: <birth-datetime>");
	}
	a.birth_raw=pos[0];
	cli_str(app,a);
	return 0;
}

int cmd_asp(AppCtx&app,const std::vector<std::string>&args){
	AspArgs a;
	a.pretty=app.cfg.def_pretty;
	OptMap h={
		{"--frame",[&](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){
			 a.frame=to_low(req_val(src,idx,opt));
		 }},
	};
	out_opts(h,a);
	if(!parse_args(h,args,a.times,"aspects",use_asp)){
		return 0;
	}
	out_defs(app,a);
	if(a.times.empty()||a.times.size()>2){
		throw std::invalid_argument(
			"aspects requires: <datetimeA> [<datetimeB>]");
	}
	cli_asp(app,a);
	return 0;
}

int cmd_trans(AppCtx&app,const std::vector<std::string>&args){
	TransArgs a;
	a.pretty=app.cfg.def_pretty;
	OptMap h={
		{"--from",[&](const std::vector<std::string>&src,std::size_t&idx,
					  const std::string&opt){ a.from=req_val(src,idx,opt); }},
		{"--to",[&](const std::vector<std::string>&src,std::size_t&idx,
					const std::string&opt){ a.to=req_val(src,idx,opt); }},
		{"--step",[&](const std::vector<std::string>&src,std::size_t&idx,
					  const std::string&opt){
			 a.step=parse_num(req_val(src,idx,opt),"--step");
		 }},
		{"--frame",[&](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){
			 a.frame=to_low(req_val(src,idx,opt));
		 }},
	};
	out_opts(h,a);
	std::vector<std::string> pos;
	if(!parse_args(h,args,pos,"transits",use_trans)){
		return 0;
	}
	out_defs(app,a);
	if(pos.size()!=1||a.from.empty()||a.to.empty()){
		throw std::invalid_argument(
			"transits requires: <birth-datetime> --from <date> --to <date>");
	}
	a.birth_raw=pos[0];
	cli_trans(app,a);
	return 0;
}

int cmd_pulse(AppCtx&app,const std::vector<std::string>&args){
	PulseArgs a;
	a.pretty=app.cfg.def_pretty;
	OptMap h={
		{"--from",[&](const std::vector<std::string>&src,std::size_t&idx,
					  const std::string&opt){ a.from=req_val(src,idx,opt); }},
		{"--days",[&](const std::vector<std::string>&src,std::size_t&idx,
					  const std::string&opt){
			 a.days=parse_int(req_val(src,idx,opt),"--days");
		 }},
		{"--frame",[&](const std::vector<std::string>&src,std::size_t&idx,
					   const std::string&opt){
			 a.frame=to_low(req_val(src,idx,opt));
		 }},
	};
	out_opts(h,a);
	std::vector<std::string> pos;
	if(!parse_args(h,args,pos,"pulse",use_pulse)){
		return 0;
	}
	out_defs(app,a);
	if(pos.size()!=1||a.from.empty()){
		throw std::invalid_argument(
			"pulse requires: <birth-datetime> --from <date>");
	}
	a.birth_raw=pos[0];
	cli_pulse(app,a);
	return 0;
}

int cmd_cfg(AppCtx&app,const std::vector<std::string>&args){
	std::vector<std::pair<std::string,std::string>> sets;
	std::string format="txt";
	bool pretty=app.cfg.def_pretty;
	OptMap h={
		{"--set",[&](const std::vector<std::string>&src,std::size_t&idx,
					 const std::string&opt){
			 std::string kv=req_val(src,idx,opt);
			 auto eq=kv.find('=');
			 if(eq==std::string::npos){
				 throw std::invalid_argument("--set expects key=value: "+kv);
			 }
			 sets.emplace_back(trim(kv.substr(0,eq)),trim(kv.substr(eq+1)));
		 }},
		{"--format",[&](const std::vector<std::string>&src,std::size_t&idx,
						const std::string&opt){
			 format=to_low(req_val(src,idx,opt));
		 }},
	};
	std::vector<std::string> pos;
	if(!parse_args(h,args,pos,"config",use_cfg)){
		return 0;
	}
	if(!pos.empty()){
		throw std::invalid_argument("unexpected argument for config: "+pos[0]);
	}

	if(!sets.empty()){
		for(const auto&kv : sets){
			set_key(app.cfg,kv.first,kv.second);
		}
		chk_cfg(app.cfg);
		if(!save_cfg(app.cfg,app.cfg_file)){
			throw std::runtime_error("failed to save config: "+app.cfg_file);
		}
		if(!app.quiet){
			std::cerr<<"written: "<<app.cfg_file<<"\n";
		}
		return 0;
	}

	auto items=cfg_items(app.cfg);
	emit(
		format,"",pretty,app.quiet,"config",app.cfg.ephem,
		[&](std::ostream&os){
			os<<"file="<<app.cfg_file<<"\n";
			for(const auto&kv : items){
				os<<kv.first<<"="<<kv.second<<"\n";
			}
		},
		[&](JsonWriter&w){
			w.obj_begin();
			w.field("file",app.cfg_file);
			for(const auto&kv : items){
				w.field(kv.first,kv.second);
			}
			w.obj_end();
		});
	return 0;
}

int run_cli(std::vector<std::string> args){
	GlobalOpts g=take_global(args);
	if(args.empty()||args[0]=="-h"||args[0]=="--help"){
		use_main();
		return 0;
	}
	if(args[0]=="--version"){
		std::cout<<tool_ver()<<std::endl;
		return 0;
	}

	using Cmd=int (*)(AppCtx&,const std::vector<std::string>&);
	static const std::unordered_map<std::string,Cmd> cmds={
		{"positions",cmd_pos},{"nakshatra",cmd_nak},{"dasha",cmd_dasha},
		{"strength",cmd_str}, {"aspects",cmd_asp},	{"transits",cmd_trans},
		{"pulse",cmd_pulse},  {"config",cmd_cfg},
	};
	auto it=cmds.find(args[0]);
	if(it==cmds.end()){
		throw std::invalid_argument("unknown command: "+args[0]);
	}
	AppCtx app(g);
	return it->second(app,std::vector<std::string>(args.begin()+1,args.end()));
}

int run_main(const std::vector<std::string>&args,std::ostream&err){
	try{
		return run_cli(args);
	}catch(const std::invalid_argument&ex){
		err<<"argument error: "<<ex.what()<<std::endl;
		return 2;
	}catch(const std::out_of_range&ex){
		err<<"range error: "<<ex.what()<<std::endl;
		return 3;
	}catch(const std::exception&ex){
		err<<"error: "<<ex.what()<<std::endl;
		return 1;
	}
}

std::string tool_ver(){ return "graha 1.0.0"; }

void use_main(){
	std::cout<<"Usage:\n"
			 <<"  graha --help\n"
			 <<"  graha --version\n"
			 <<"  graha positions ...\n"
			 <<"  graha nakshatra ...\n"
			 <<"  graha dasha     ...\n"
			 <<"  graha strength  ...\n"
			 <<"  graha aspects   ...\n"
			 <<"  graha transits  ...\n"
			 <<"  graha pulse     ...\n"
			 <<"  graha config    ...\n"
			 <<"\n"
			 <<"Global options:\n"
			 <<"  --ephem <bsp>   JPL kernel (overrides the config file)\n"
			 <<"  --quiet         no diagnostics on stderr\n"
			 <<"\n"
			 <<"Subcommand help:\n"
			 <<"  graha <command> --help\n";
}

void use_pos(){
	std::cout<<"Usage:\n"
			 <<"  graha positions <datetime> [--frame tropical|sidereal]\n"
			 <<"                  [--lat <deg> --lon <deg>] [--tz <zone>]\n"
			 <<"                  [--format txt|json] [--out <file>] "
			   "[--pretty 0|1]\n"
			 <<"  graha positions --file <list> [--jobs N] [...]\n"
			 <<"Examples:\n"
			 <<"  graha positions 2024-03-20T03:06:00Z --frame sidereal\n"
			 <<"  graha positions 1990-05-15T08:30 --tz Asia/Kolkata --lat "
			   "19.07 --lon 72.88\n";
}

void use_nak(){
	std::cout<<"Usage:\n"
			 <<"  graha nakshatra <sidereal-longitude> [--format txt|json]\n";
}

void use_dasha(){
	std::cout<<"Usage:\n"
			 <<"  graha dasha <birth-datetime> --lat <deg> --lon <deg> [--tz "
			   "<zone>]\n"
			 <<"              [--until <date>] [--depth 1..5] [--at <date>]\n"
			 <<"              [--format txt|json] [--out <file>]\n"
			 <<"A birth date without a time uses local noon.\n";
}

void use_str(){
	std::cout<<"Usage:\n"
			 <<"  graha strength <birth-datetime> --lat <deg> --lon <deg> "
			   "[--tz <zone>]\n"
			 <<"                 [--frame sidereal|tropical] [--format "
			   "txt|json]\n";
}

void use_asp(){
	std::cout<<"Usage:\n"
			 <<"  graha aspects <datetimeA> [<datetimeB>] [--frame "
			   "tropical|sidereal]\n"
			 <<"One datetime lists the aspects inside that chart, two compare "
			   "the charts.\n";
}

void use_trans(){
	std::cout<<"Usage:\n"
			 <<"  graha transits <birth-datetime> --from <date> --to <date> "
			   "[--step <days>]\n"
			 <<"                 [--frame tropical|sidereal] [--tz <zone>]\n";
}

void use_pulse(){
	std::cout<<"Usage:\n"
			 <<"  graha pulse <birth-datetime> --from <date> [--days N]\n"
			 <<"Daily pulse with intensity, peak windows and the next shift.\n";
}

void use_cfg(){
	std::cout<<"Usage:\n"
			 <<"  graha config [--format txt|json]\n"
			 <<"  graha config --set <key>=<value> [--set ...]\n"
			 <<"Keys:\n"
			 <<"  ephem | cache_size | cache_res_sec | default_tz | def_fmt | "
			   "def_pretty\n"
			 <<"  orb.<aspect>.fast | orb.<aspect>.slow | w.pos | w.dir | "
			   "w.temp\n"
			 <<"  retro_mult | pulse.flow_ratio\n"
			 <<"The file is graha.cfg, or $GRAHA_CFG when set.\n";
}
