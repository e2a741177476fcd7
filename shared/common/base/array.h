#ifndef ARRAY_H
#define ARRAY_H

#include "defs.h"
#include <vector>

namespace lzk {

//-----------------------------------------------------------------------------
//	class dynamic_array
//-----------------------------------------------------------------------------

template<typename T> class dynamic_array {
	std::vector<T>	v;
public:
	typedef T		element;
	typedef T*		iterator;
	typedef const T*	const_iterator;

	dynamic_array()	{}
	explicit dynamic_array(size_t n) : v(n) {}
	dynamic_array(size_t n, const T &t) : v(n, t) {}
	dynamic_array(const T *a, const T *b) : v(a, b) {}
	dynamic_array(const_memory_block m) : v(m.begin(), m.end()) { static_assert(sizeof(T) == 1, "byte arrays only"); }

	size_t		size()					const	{ return v.size(); }
	uint32		size32()				const	{ return uint32(v.size()); }
	bool		empty()					const	{ return v.empty(); }
	T*			begin()							{ return v.data(); }
	const T*	begin()					const	{ return v.data(); }
	T*			end()							{ return v.data() + v.size(); }
	const T*	end()					const	{ return v.data() + v.size(); }
	T&			operator[](size_t i)			{ return v[i]; }
	const T&	operator[](size_t i)	const	{ return v[i]; }
	T&			front()							{ return v.front(); }
	T&			back()							{ return v.back(); }
	const T&	back()					const	{ return v.back(); }

	void		clear()							{ v.clear(); }
	void		reserve(size_t n)				{ v.reserve(n); }
	void		resize(size_t n)				{ v.resize(n); }
	void		resize(size_t n, const T &t)	{ v.resize(n, t); }
	void		push_back(const T &t)			{ v.push_back(t); }
	void		pop_back()						{ v.pop_back(); }
	void		swap(dynamic_array &b)			{ v.swap(b.v); }

	// grow by n elements and return the first of them
	T*			expand(size_t n = 1) {
		size_t	s = v.size();
		v.resize(s + n);
		return v.data() + s;
	}
	T*			append(const T *p, size_t n) {
		T	*d = expand(n);
		std::copy(p, p + n, d);
		return d;
	}
	void		fill(const T &t)				{ std::fill(v.begin(), v.end(), t); }

	operator const_memory_block()		const	{ return const_memory_block(v.data(), v.size() * sizeof(T)); }
	operator memory_block()						{ return memory_block(v.data(), v.size() * sizeof(T)); }
};

} // namespace lzk

#endif // ARRAY_H
