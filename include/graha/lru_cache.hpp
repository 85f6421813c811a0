#pragma once

#include<cstddef>
#include<list>
#include<map>
#include<mutex>
#include<optional>
#include<utility>

struct CacheStats{
	std::size_t entries=0;
	std::size_t hits=0;
	std::size_t misses=0;
};

// Least-recently-used map behind a single mutex. Capacity 0 disables it.
template<typename K,typename V>
class LruCache{
  public:
	explicit LruCache(std::size_t cap) : cap_(cap){}

	LruCache(const LruCache&)=delete;
	LruCache&operator=(const LruCache&)=delete;

	std::optional<V> get(const K&key){
		std::lock_guard<std::mutex> lock(mtx_);
		auto it=index_.find(key);
		if(it==index_.end()){
			++misses_;
			return std::nullopt;
		}
		++hits_;
		order_.splice(order_.begin(),order_,it->second);
		return it->second->second;
	}

	void put(const K&key,const V&val){
		std::lock_guard<std::mutex> lock(mtx_);
		if(cap_==0){
			return;
		}
		auto it=index_.find(key);
		if(it!=index_.end()){
			it->second->second=val;
			order_.splice(order_.begin(),order_,it->second);
			return;
		}
		order_.emplace_front(key,val);
		index_[key]=order_.begin();
		while(order_.size()>cap_){
			index_.erase(order_.back().first);
			order_.pop_back();
		}
	}

	void clear(){
		std::lock_guard<std::mutex> lock(mtx_);
		order_.clear();
		index_.clear();
		hits_=0;
		misses_=0;
	}

	CacheStats stats() const{
		std::lock_guard<std::mutex> lock(mtx_);
		CacheStats s;
		s.entries=order_.size();
		s.hits=hits_;
		s.misses=misses_;
		return s;
	}

	std::size_t capacity() const{ return cap_; }

  private:
	using Item=std::pair<K,V>;

	std::size_t cap_;
	std::list<Item> order_;
	std::map<K,typename std::list<Item>::iterator> index_;
	std::size_t hits_=0;
	std::size_t misses_=0;
	mutable std::mutex mtx_;
};
