#ifndef WINDOW_H
#define WINDOW_H

#include "base/defs.h"
#include "base/array.h"

namespace lzk {

//-----------------------------------------------------------------------------
//	Dictionary
//	append-only window; positions and distances are relative to the last reset
//	bytes before the reset stay in the buffer (they are still output) but can no longer be referenced
//-----------------------------------------------------------------------------

struct Dictionary {
	dynamic_array<uint8>	buffer;
	size_t					base;
	uint32					dict_size;

	Dictionary(uint32 dict_size) : base(0), dict_size(dict_size) {}

	void			reset()							{ base = buffer.size(); }
	void			clear()							{ buffer.clear(); base = 0; }

	size_t			pos()					const	{ return buffer.size() - base; }
	bool			valid(uint64 dist)		const	{ return dist >= 1 && dist <= dict_size && dist <= pos(); }
	const uint8*	data(size_t offset)		const	{ return buffer.begin() + base + offset; }
	uint8			get(size_t offset)		const	{ return buffer[base + offset]; }
	uint8			back(uint32 dist)		const	{ return buffer[buffer.size() - dist]; }

	void			put(uint8 b)					{ buffer.push_back(b); }
	void			append(const void *p, size_t n)	{ buffer.append((const uint8*)p, n); }

	// appends len bytes copied from dist back; source and destination may overlap
	void			copy(uint32 dist, uint32 len) {
		size_t		from	= buffer.size() - dist;
		uint8		*d		= buffer.expand(len);
		const uint8	*s		= buffer.begin() + from;
		while (len--)
			*d++ = *s++;
	}
};

} // namespace lzk

#endif // WINDOW_H
