#pragma once

#include<iosfwd>
#include<string>
#include<vector>

std::string js_escape(const std::string&s);

// Streaming JSON emitter. Misuse (value without key, unbalanced ends)
// throws std::logic_error.
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
	// 17 significant digits; NaN/inf become null
	void value(double v);
	void value(int v);
	void value(bool v);
	void null_val();

	void kv(const std::string&name,const std::string&v){
		key(name);
		value(v);
	}
	void kv(const std::string&name,const char*v){
		key(name);
		value(v);
	}
	void kv(const std::string&name,double v){
		key(name);
		value(v);
	}
	void kv(const std::string&name,int v){
		key(name);
		value(v);
	}
	void kv(const std::string&name,bool v){
		key(name);
		value(v);
	}

	bool done() const{ return root_ok_&&stack_.empty(); }

  private:
	struct Frame{
		bool is_obj=false;
		bool empty=true;
		bool want_val=false;
	};

	std::ostream&os_;
	bool pretty_;
	int ind_size_;
	bool root_ok_=false;
	std::vector<Frame> stack_;

	void newline();
	void val_begin();
	void close(bool is_obj,char ch);
};
