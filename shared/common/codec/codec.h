#ifndef CODEC_H
#define CODEC_H

#include "base/defs.h"
#include "base/array.h"

namespace lzk {

//-----------------------------------------------------------------------------
//	match helpers
//-----------------------------------------------------------------------------

inline uint32 num_zero_bytes(uint64 diff) {
#ifdef _MSC_VER
	unsigned long	i;
	_BitScanForward64(&i, diff);
	return i >> 3;
#else
	return __builtin_ctzll(diff) >> 3;
#endif
}

// end of the run of bytes at src that equal the bytes d further on (d is negative for back references)
inline const uint8 *match_end(const uint8* src, intptr_t d, const uint8* src_end) {
	while (src + 8 <= src_end) {
		if (uint64 diff = load_packed<uint64>(src + d) ^ load_packed<uint64>(src))
			return src + num_zero_bytes(diff);
		src += 8;
	}
	while (src < src_end && src[d] == src[0])
		++src;
	return src;
}

inline const uint8 *match_end(const uint8* src, const uint8* ref, const uint8* src_end)	{ return match_end(src, ref - src, src_end); }
inline uint32		match_len(const uint8* src, const uint8* ref, const uint8* src_end)	{ return uint32(match_end(src, ref - src, src_end) - src); }

//-----------------------------------------------------------------------------
//	test data
//-----------------------------------------------------------------------------

inline const_memory_block get_test_data() {
	static const char source[] =
		"Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod\n"
		"tempor incididunt ut labore et dolore magna aliqua. Ut enim ad minim\n"
		"veniam, quis nostrud exercitation ullamco laboris nisi ut aliquip ex ea\n"
		"commodo consequat. Duis aute irure dolor in reprehenderit in voluptate\n"
		"velit esse cillum dolore eu fugiat nulla pariatur. Excepteur sint occaecat\n"
		"cupidatat non proident, sunt in culpa qui officia deserunt mollit anim id\n"
		"est laborum.\n"
		"\n"
		"Sed ut perspiciatis unde omnis iste natus error sit voluptatem accusantium\n"
		"doloremque laudantium, totam rem aperiam, eaque ipsa quae ab illo inventore\n"
		"veritatis et quasi architecto beatae vitae dicta sunt explicabo. Nemo enim\n"
		"ipsam voluptatem quia voluptas sit aspernatur aut odit aut fugit, sed quia\n"
		"consequuntur magni dolores eos qui ratione voluptatem sequi nesciunt. Neque\n"
		"porro quisquam est, qui dolorem ipsum quia dolor sit amet, consectetur,\n"
		"adipisci velit, sed quia non numquam eius modi tempora incidunt ut labore\n"
		"et dolore magnam aliquam quaerat voluptatem. Ut enim ad minima veniam, quis\n"
		"nostrum exercitationem ullam corporis suscipit laboriosam, nisi ut aliquid\n"
		"ex ea commodi consequatur? Quis autem vel eum iure reprehenderit qui in ea\n"
		"voluptate velit esse quam nihil molestiae consequatur, vel illum qui\n"
		"dolorem eum fugiat quo voluptas nulla pariatur?\n";
	return source;
}

// xorshift noise; the same seed always gives the same bytes
inline dynamic_array<uint8> get_random_data(size_t size, uint32 seed = 0x2545F491) {
	dynamic_array<uint8>	data(size);
	uint32	x = seed | 1;
	for (auto &i : data) {
		x ^= x << 13;
		x ^= x >> 17;
		x ^= x << 5;
		i = uint8(x >> 24);
	}
	return data;
}

inline dynamic_array<uint8> get_repeated_data(const_memory_block pattern, size_t size) {
	dynamic_array<uint8>	data(size);
	for (size_t i = 0; i < size; i++)
		data[i] = pattern.begin()[i % pattern.length()];
	return data;
}

// text with long range repeats and some noise, closer to real input than either of the above
inline dynamic_array<uint8> get_mixed_data(size_t size, uint32 seed = 1) {
	const_memory_block		text	= get_test_data();
	dynamic_array<uint8>	noise	= get_random_data(size / 16 + 1, seed);
	dynamic_array<uint8>	data;
	data.reserve(size);
	for (size_t i = 0, j = 0; data.size() < size; i++) {
		size_t	offset	= (i * 7919) % text.length();
		size_t	n		= min(min(size_t(40 + (i % 90)), text.length() - offset), size - data.size());
		data.append(text.begin() + offset, n);
		if (i % 3 == 0 && data.size() < size && j < noise.size())
			data.push_back(noise[j++]);
	}
	return data;
}

} // namespace lzk

#endif // CODEC_H
