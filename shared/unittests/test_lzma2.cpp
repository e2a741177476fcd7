#include "codec/lzma2.h"

using namespace lzma;

static bool same(const_memory_block a, const_memory_block b) {
	return a == b;
}

static dynamic_array<Chunk> chunks_of(const_memory_block stream) {
	dynamic_array<Chunk>	chunks;
	LZK_ALWAYS_ASSERT(parse_chunks(stream, chunks) == OK);
	return chunks;
}

static void round_trip(const_memory_block data, const Encoder::EncProps &props = Encoder::EncProps(), uint32 blocksize = Encoder2::BLOCK_SIZE_SOLID) {
	dynamic_array<uint8>	packed, out;
	LZK_ALWAYS_ASSERT(lzma2_encode(packed, data, props, true, blocksize) == OK);
	LZK_ALWAYS_ASSERT(packed.size() >= 2 && packed.back() == 0);
	LZK_ALWAYS_ASSERT(lzma2_decode(out, packed, 0, false) == OK);
	LZK_ALWAYS_ASSERT(same(out, data));

	for (auto &c : chunks_of(const_memory_block(packed).slice(1))) {
		LZK_ALWAYS_ASSERT(c.unpack_size <= LZMA2::UNPACK_SIZE_MAX);
		LZK_ALWAYS_ASSERT(c.pack_size <= LZMA2::PACK_SIZE_MAX);
	}
}

// the optimal parse on ordinary text, through the plain lc/lp/pb entry point
struct test_lzma2_text {
	test_lzma2_text() {
		const_memory_block		text = get_test_data();
		dynamic_array<uint8>	packed, out;
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, text, 1 << 20, 3, 0, 2, true) == OK);
		LZK_ALWAYS_ASSERT(packed.size() > 2 && packed.size() < text.length());
		LZK_ALWAYS_ASSERT(lzma2_decode(out, packed, 0, false) == OK);
		LZK_ALWAYS_ASSERT(same(out, text));
	}
} _test_lzma2_text;

struct test_lzma2_round_trip {
	test_lzma2_round_trip() {
		round_trip(const_memory_block());
		round_trip("x");
		round_trip(get_test_data());
		round_trip(get_random_data(100000));
		round_trip(get_mixed_data(300000));
		round_trip(get_mixed_data(300000), Encoder::EncProps::Preset(1));

		// either side of a full chunk
		Encoder::EncProps	fast = Encoder::EncProps::Preset(2);
		for (size_t size : {size_t(2 << 20) - 1, size_t(2 << 20), size_t(2 << 20) + 1}) {
			round_trip(get_repeated_data("0123456789abcdefghij", size));
			round_trip(get_mixed_data(size, 5), fast);
		}

		// the parameter space the framing allows
		Encoder::EncProps	props(1 << 16);
		props.lc = 0; props.lp = 4; props.pb = 4;
		round_trip(get_mixed_data(50000), props);
		props.lc = 4; props.lp = 0; props.pb = 0;
		round_trip(get_mixed_data(50000), props);

		// 12000 bytes of a three byte period
		auto	abc = get_repeated_data("abc", 12000);
		dynamic_array<uint8>	packed, out;
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, abc, 1 << 20, 3, 0, 2, true) == OK);
		LZK_ALWAYS_ASSERT(packed.size() < 200);
		LZK_ALWAYS_ASSERT(lzma2_decode(out, packed, 0, false) == OK && same(out, abc));

		// without the property byte the caller supplies the dictionary size
		packed.clear();
		auto	text = get_mixed_data(100000, 9);
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, text, 1 << 16, 3, 0, 2, false) == OK);
		LZK_ALWAYS_ASSERT(lzma2_decode(out, packed, 1 << 16, true) == OK && same(out, text));

		// empty input is just the end byte
		packed.clear();
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, const_memory_block(), 1 << 16, 3, 0, 2, false) == OK);
		LZK_ALWAYS_ASSERT(packed.size() == 1 && packed[0] == 0);
	}
} _test_lzma2_round_trip;

struct test_lzma2_chunks {
	test_lzma2_chunks() {
		dynamic_array<uint8>	packed;

		// a long run is split by the unpacked size limit
		auto	big = get_repeated_data("abcdefgh", 5 << 20);
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, big, 1 << 22, 3, 0, 2, false) == OK);
		auto	chunks = chunks_of(packed);
		LZK_ALWAYS_ASSERT(chunks.size() >= 4 && chunks.back().type == Chunk::END);
		LZK_ALWAYS_ASSERT(chunks[0].dict_reset && chunks[0].new_props && chunks[0].props == Props());

		uint64	total = 0;
		for (auto &c : chunks) {
			LZK_ALWAYS_ASSERT(c.unpack_size <= LZMA2::UNPACK_SIZE_MAX && c.pack_size <= LZMA2::PACK_SIZE_MAX);
			total += c.unpack_size;
		}
		LZK_ALWAYS_ASSERT(total == big.size());
		for (size_t i = 1; i + 1 < chunks.size(); i++)
			LZK_ALWAYS_ASSERT(chunks[i].type == Chunk::LZMA && !chunks[i].dict_reset && !chunks[i].state_reset);

		// noise is stored, and the first chunk after stored data resets the state
		dynamic_array<uint8>	data = get_random_data(70000, 11);
		auto	tail = get_repeated_data("abc", 200000);
		data.append(tail.begin(), tail.size());

		packed.clear();
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, data, 1 << 20, 3, 0, 2, false) == OK);
		chunks = chunks_of(packed);
		LZK_ALWAYS_ASSERT(chunks[0].type == Chunk::COPY && chunks[0].dict_reset);

		bool	found = false;
		for (size_t i = 1; i < chunks.size(); i++) {
			if (chunks[i - 1].type == Chunk::COPY && chunks[i].type == Chunk::LZMA) {
				LZK_ALWAYS_ASSERT(chunks[i].state_reset);
				found = true;
			}
			if (chunks[i].type == Chunk::COPY)
				LZK_ALWAYS_ASSERT(chunks[i].data.length() <= LZMA2::COPY_CHUNK_SIZE && !chunks[i].dict_reset);
		}
		LZK_ALWAYS_ASSERT(found);

		dynamic_array<uint8>	out;
		LZK_ALWAYS_ASSERT(lzma2_decode(out, packed, 1 << 20, true) == OK && same(out, data));

		// every block starts over
		auto	text = get_mixed_data(250000, 2);
		packed.clear();
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, text, Encoder::EncProps(1 << 20), false, 100000) == OK);
		int		resets = 0;
		for (auto &c : chunks_of(packed))
			resets += c.dict_reset;
		LZK_ALWAYS_ASSERT(resets == 3);
		LZK_ALWAYS_ASSERT(lzma2_decode(out, packed, 1 << 20, true) == OK && same(out, text));

		// same input, same output
		dynamic_array<uint8>	again;
		LZK_ALWAYS_ASSERT(lzma2_encode(again, text, Encoder::EncProps(1 << 20), false, 100000) == OK && same(again, packed));

		// probabilities never leave their range
		Decoder2	dec(1 << 20);
		LZK_ALWAYS_ASSERT(dec.Decode(out, packed) == OK);
		bool	in_range = true;
		for (size_t i = 0; i < dec.probability.size(); i++)
			in_range = in_range && dec.probability[i] >= 1 && dec.probability[i] <= 2047;
		LZK_ALWAYS_ASSERT(in_range);
	}
} _test_lzma2_chunks;

struct test_lzma2_props {
	test_lzma2_props() {
		LZK_ALWAYS_ASSERT(LZMA2::dic_size_from_prop(0) == 4096);
		LZK_ALWAYS_ASSERT(LZMA2::dic_size_from_prop(1) == 6144);
		LZK_ALWAYS_ASSERT(LZMA2::dic_size_from_prop(20) == 4 << 20);
		LZK_ALWAYS_ASSERT(LZMA2::dic_size_from_prop(39) == 3u << 30);
		LZK_ALWAYS_ASSERT(LZMA2::dic_size_from_prop(40) == 0xFFFFFFFFu);

		LZK_ALWAYS_ASSERT(LZMA2::dic_prop_from_size(4096) == 0);
		LZK_ALWAYS_ASSERT(LZMA2::dic_prop_from_size(4097) == 1);
		LZK_ALWAYS_ASSERT(LZMA2::dic_prop_from_size(4 << 20) == 20);
		LZK_ALWAYS_ASSERT(LZMA2::dic_prop_from_size(0xFFFFFFFFu) == 40);

		dynamic_array<uint8>	packed;
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, "abc", 1 << 22, 3, 0, 2, true) == OK);
		LZK_ALWAYS_ASSERT(packed[0] == 20);

		// rejected before anything is written
		packed.clear();
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, "abc", 1 << 20, 3, 2, 2, true) == ERROR_PARAM && packed.empty());
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, "abc", 1024, 3, 0, 2, true) == ERROR_PARAM && packed.empty());
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, "abc", 1 << 20, 3, 0, 5, true) == ERROR_PARAM && packed.empty());
	}
} _test_lzma2_props;

struct test_lzma2_errors {
	static errors decode(const_memory_block stream) {
		dynamic_array<uint8>	out;
		return lzma2_decode(out, stream, 1 << 16, true);
	}

	test_lzma2_errors() {
		dynamic_array<uint8>	out;

		// control bytes 3 to 0x7f mean nothing
		static const uint8	bad3[]		= {0x03, 0x00, 0x00, 'a', 0x00};
		static const uint8	bad7f[]		= {0x7f, 0x00, 0x00, 'a', 0x00};
		LZK_ALWAYS_ASSERT(decode(const_memory_block(bad3, sizeof(bad3))) == ERROR_CONTROL);
		LZK_ALWAYS_ASSERT(decode(const_memory_block(bad7f, sizeof(bad7f))) == ERROR_CONTROL);

		// resets
		static const uint8	no_dict[]	= {0x02, 0x00, 0x02, 'a', 'b', 'c', 0x00};
		static const uint8	no_state[]	= {0x01, 0x00, 0x00, 'a', 0x80, 0x00, 0x00, 0x00, 0x04, 0, 0, 0, 0, 0, 0x00};
		static const uint8	no_props[]	= {0x01, 0x00, 0x00, 'a', 0xA0, 0x00, 0x00, 0x00, 0x04, 0, 0, 0, 0, 0, 0x00};
		static const uint8	bad_props[]	= {0xE0, 0x00, 0x00, 0x00, 0x04, 225, 0, 0, 0, 0, 0, 0x00};
		LZK_ALWAYS_ASSERT(decode(const_memory_block(no_dict, sizeof(no_dict))) == ERROR_RESET);
		LZK_ALWAYS_ASSERT(decode(const_memory_block(no_state, sizeof(no_state))) == ERROR_RESET);
		LZK_ALWAYS_ASSERT(decode(const_memory_block(no_props, sizeof(no_props))) == ERROR_PROPS);
		LZK_ALWAYS_ASSERT(decode(const_memory_block(bad_props, sizeof(bad_props))) == ERROR_PROPS);

		// stored chunks decode as is
		static const uint8	stored[]	= {0x01, 0x00, 0x02, 'a', 'b', 'c', 0x02, 0x00, 0x00, 'd', 0x00};
		LZK_ALWAYS_ASSERT(lzma2_decode(out, const_memory_block(stored, sizeof(stored)), 1 << 16, true) == OK && same(out, "abcd"));

		// dictionary property byte
		static const uint8	big_prop[]	= {41, 0x00};
		LZK_ALWAYS_ASSERT(lzma2_decode(out, const_memory_block(big_prop, sizeof(big_prop)), 0, false) == ERROR_PROPS);
		LZK_ALWAYS_ASSERT(lzma2_decode(out, const_memory_block(), 0, false) == ERROR_TRUNCATED);

		// truncation anywhere
		auto	text = get_mixed_data(100000, 4);
		dynamic_array<uint8>	packed;
		LZK_ALWAYS_ASSERT(lzma2_encode(packed, text, 1 << 16, 3, 0, 2, false) == OK);
		LZK_ALWAYS_ASSERT(decode(const_memory_block(packed.begin(), packed.size() - 1)) == ERROR_TRUNCATED);
		LZK_ALWAYS_ASSERT(decode(const_memory_block(packed.begin(), packed.size() / 2)) == ERROR_TRUNCATED);
		LZK_ALWAYS_ASSERT(decode(const_memory_block(packed.begin(), 3)) == ERROR_TRUNCATED);
		LZK_ALWAYS_ASSERT(decode(const_memory_block()) == ERROR_TRUNCATED);

		// single bit flips inside the first payload are never silent
		auto	first = chunks_of(packed)[0];
		LZK_ALWAYS_ASSERT(first.type == Chunk::LZMA && first.pack_size > 64);
		size_t	payload_at = first.data.begin() - packed.begin();
		for (size_t i = 1; i < 32; i++) {
			size_t	at = payload_at + first.pack_size * i / 32;
			dynamic_array<uint8>	bad(packed.begin(), packed.end());
			bad[at] ^= uint8(1 << (i & 7));
			errors	err = lzma2_decode(out, bad, 1 << 16, true);
			LZK_ALWAYS_ASSERT(err != OK || !same(out, text));
		}

		// a match reaching back before the first byte
		{
			State	model;
			model.probability.resize(Props().GetNumProbs());
			model.Reset();
			auto	probs = model.probs();

			dynamic_array<uint8>	payload;
			{
				byte_writer			w(payload);
				Encoder::encoder	rc(w);
				rc.bit(probs[State::IsMatch + State::PosState(State::LIT, 0)], false);
				rc.tree(probs + State::Literal, 8, 'a');
				rc.bit(probs[State::IsMatch + State::PosState(State::LIT, 1)], true);
				rc.bit(probs[State::IsRep + State::LIT], false);
				Encoder::EncodeLength(rc, probs + State::LenCoder, 0, 1);
				Encoder::EncodeDistance(rc, probs, 4, 0);
				rc.flush();
			}

			dynamic_array<uint8>	stream;
			uint8	header[6] = {0xE0, 0x00, 0x02, 0, 0, Props().encode()};
			store_be<uint16>(header + 3, uint16(payload.size() - 1));
			stream.append(header, 6);
			stream.append(payload.begin(), payload.size());
			stream.push_back(0);
			LZK_ALWAYS_ASSERT(decode(stream) == ERROR_DISTANCE);
		}
	}
} _test_lzma2_errors;
