#ifndef LZMA_ALONE_H
#define LZMA_ALONE_H

#include "lzma.h"

namespace lzma {

//-----------------------------------------------------------------------------
//	.lzma files
//	props byte, dict size (LE32), uncompressed size (LE64, all ones if unknown), then the raw stream
//-----------------------------------------------------------------------------

struct Alone {
	enum {
		HEADER_SIZE	= 13,
	};

	Props	props;
	uint32	dict_size;
	uint64	unpack_size;

	Alone() : dict_size(0), unpack_size(UNKNOWN_SIZE) {}

	void	write(uint8 header[HEADER_SIZE]) const;
	errors	read(byte_reader &file);
};

namespace alone {
// an unknown size is recorded as all ones and the stream ends with an end marker
errors	encode(dynamic_array<uint8> &out, const_memory_block src, const Encoder::EncProps &props, bool known_size = true);
errors	decode(dynamic_array<uint8> &out, const_memory_block src);
}

}  // namespace lzma
#endif	// LZMA_ALONE_H
