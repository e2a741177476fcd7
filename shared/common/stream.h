#ifndef STREAM_H
#define STREAM_H

#include "base/defs.h"
#include "base/array.h"

namespace lzk {

//-----------------------------------------------------------------------------
//	byte_reader - reads from a bounded block; reads past the end return 0 and are counted
//-----------------------------------------------------------------------------

struct byte_reader {
	const uint8	*p, *end;
	uint32		overrun;

	byte_reader(const uint8 *p, const uint8 *end) : p(p), end(end), overrun(0) {}
	byte_reader(const_memory_block b) : p(b.begin()), end(b.end()), overrun(0) {}

	int		getc() {
		if (p < end)
			return *p++;
		++overrun;
		return 0;
	}
	size_t	remaining()		const	{ return end - p; }
	bool	eof()			const	{ return p == end; }

	// returns nullptr without consuming anything if fewer than n bytes remain
	const uint8*	get_block(size_t n) {
		if (remaining() < n)
			return nullptr;
		return exchange(p, p + n);
	}
};

//-----------------------------------------------------------------------------
//	byte_writer - appends to a dynamic_array
//-----------------------------------------------------------------------------

struct byte_writer {
	dynamic_array<uint8>	*a;
	size_t					start;

	byte_writer(dynamic_array<uint8> &a) : a(&a), start(a.size()) {}

	void	putc(int c)							{ a->push_back(uint8(c)); }
	size_t	tell()						const	{ return a->size() - start; }
};

} // namespace lzk

#endif // STREAM_H
