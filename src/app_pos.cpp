#include "graha/app_pos.hpp"

#include<algorithm>
#include<cmath>

double AberCorr::lightday(const Vec3&vec){ return vec.norm()/C_AUDAY; }

RetProp AberCorr::geo_prop(EphRead&eph,int target,double jd_tdb,int max_iter){
	double tr=jd_tdb;
	Vec3 xE=eph.get_pos(eph.EARTH,eph.SSB,jd_tdb);

	for(int i=0;i<max_iter;++i){
		Vec3 xt=eph.get_pos(target,eph.SSB,tr);
		double tr_new=jd_tdb-lightday(xt-xE);
		if(std::fabs(tr_new-tr)<1e-12){
			tr=tr_new;
			break;
		}
		tr=tr_new;
	}

	auto st=eph.get_state(target,eph.SSB,tr);
	Vec3 vE=eph.get_vel(eph.EARTH,eph.SSB,jd_tdb);
	return {st.first-xE,st.second-vE,tr};
}

Vec3 AberCorr::geo_app(EphRead&eph,int target,double jd_tdb,int max_iter){
	Vec3 xE_t=eph.get_pos(eph.EARTH,eph.SSB,jd_tdb);
	Vec3 vE_t=eph.get_vel(eph.EARTH,eph.SSB,jd_tdb);

	double tr=jd_tdb;
	Vec3 xt=eph.get_pos(target,eph.SSB,tr);
	for(int i=0;i<max_iter;++i){
		double tr_new=jd_tdb-lightday(xt-xE_t);
		if(std::fabs(tr_new-tr)<1e-12){
			tr=tr_new;
			break;
		}
		tr=tr_new;
		xt=eph.get_pos(target,eph.SSB,tr);
	}

	Vec3 r_geo=xt-xE_t;
	double r=r_geo.norm();
	Vec3 n=r_geo/r;

	Vec3 beta=vE_t/C_AUDAY;
	double beta2=Vec3::dot(beta,beta);
	double gamma_inv=std::sqrt(std::max(0.0,1.0-beta2));
	double nb=Vec3::dot(n,beta);

	Vec3 n_app=(gamma_inv*n+beta+(nb*beta)/(1.0+gamma_inv))/(1.0+nb);

	double n_app_norm=n_app.norm();
	if(n_app_norm==0.0){
		return n*r;
	}
	return (n_app/n_app_norm)*r;
}

AppPos::AppPos(EphRead&reader) : eph(reader),rot_ok(false),rot_jd(0.0){}

Mat3 AppPos::rot_mat(double jd_tdb){
	if(!rot_ok||rot_jd!=jd_tdb){
		rot_cache=PrecNut::ecl_mat(jd_tdb);
		rot_jd=jd_tdb;
		rot_ok=true;
	}
	return rot_cache;
}

EclState AppPos::body_calc(int target,double jd_tdb){
	Mat3 R=rot_mat(jd_tdb);
	EclSph app=to_sph(R*AberCorr::geo_app(eph,target,jd_tdb));

	// rate from the geometric state; aberration changes it negligibly
	RetProp st=AberCorr::geo_prop(eph,target,jd_tdb);
	double lam_dot=lon_rate(R*st.X,R*st.V);

	EclState out;
	out.lon=norm_deg(app.lon*R2D);
	out.lat=app.lat*R2D;
	out.dist=app.dist;
	out.speed=lam_dot*R2D;
	return out;
}
