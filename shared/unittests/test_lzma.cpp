#include "codec/lzma.h"
#include "codec/lzma_alone.h"

using namespace lzma;

static bool same(const_memory_block a, const_memory_block b) {
	return a == b;
}

static bool probs_in_range(const State &s) {
	for (size_t i = 0; i < s.probability.size(); i++) {
		if (s.probability[i] < 31 || s.probability[i] > 2017)
			return false;
	}
	return true;
}

struct test_lzma_state {
	test_lzma_state() {
		LZK_ALWAYS_ASSERT(State::NextLitState(State::LIT) == State::LIT);
		LZK_ALWAYS_ASSERT(State::NextLitState(State::SHORTREP_LIT_LIT) == State::LIT);
		LZK_ALWAYS_ASSERT(State::NextLitState(State::MATCH_LIT) == State::MATCH_LIT_LIT);
		LZK_ALWAYS_ASSERT(State::NextLitState(State::MATCH) == State::MATCH_LIT);
		LZK_ALWAYS_ASSERT(State::NextLitState(State::SHORTREP) == State::SHORTREP_LIT);
		LZK_ALWAYS_ASSERT(State::NextLitState(State::MATCH2) == State::MATCH_LIT);
		LZK_ALWAYS_ASSERT(State::NextLitState(State::REP2) == State::REP_LIT);

		LZK_ALWAYS_ASSERT(State::NextMatchState(State::LIT) == State::MATCH);
		LZK_ALWAYS_ASSERT(State::NextMatchState(State::REP) == State::MATCH2);
		LZK_ALWAYS_ASSERT(State::NextRepState(State::MATCH_LIT) == State::REP);
		LZK_ALWAYS_ASSERT(State::NextRepState(State::SHORTREP) == State::REP2);
		LZK_ALWAYS_ASSERT(State::NextShortRepState(State::LIT) == State::SHORTREP);
		LZK_ALWAYS_ASSERT(State::NextShortRepState(State::MATCH) == State::REP2);

		for (uint32 s = 0; s < State::NUM_STATES; s++) {
			LZK_ALWAYS_ASSERT(State::IsLitState(State::NextLitState(s)));
			LZK_ALWAYS_ASSERT(!State::IsLitState(State::NextMatchState(s)));
		}

		LZK_ALWAYS_ASSERT(State::GetPosSlot(0) == 0 && State::GetPosSlot(1) == 1 && State::GetPosSlot(3) == 3);
		LZK_ALWAYS_ASSERT(State::GetPosSlot(4) == 4 && State::GetPosSlot(5) == 4 && State::GetPosSlot(6) == 5);
		LZK_ALWAYS_ASSERT(State::GetPosSlot(127) == 13 && State::GetPosSlot(128) == 14);
		LZK_ALWAYS_ASSERT(State::GetPosSlot(0xFFFFFFFF) == 63);
		LZK_ALWAYS_ASSERT(State::GetLenToPosState(2) == 0 && State::GetLenToPosState(5) == 3 && State::GetLenToPosState(273) == 3);

		// IsMatch and IsRep0Long sit below the bank's origin, so their indices stay negative
		LZK_ALWAYS_ASSERT(State::IsMatch + State::PosState(State::LIT, 2) == State::IsMatch + 32);
		LZK_ALWAYS_ASSERT(State::IsMatch + State::PosState(State::REP2, 15) < 0);
		LZK_ALWAYS_ASSERT(State::IsRep0Long + State::PosState(State::REP2, 15) < State::RepLenCoder);

		Props	def;
		LZK_ALWAYS_ASSERT(def.encode() == 93);
		Props	p(93);
		LZK_ALWAYS_ASSERT(p == def && p.lc == 3 && p.lp == 0 && p.pb == 2);
		LZK_ALWAYS_ASSERT(Props(uint8(224)).valid() && !Props(uint8(225)).valid());
		LZK_ALWAYS_ASSERT(Props(4, 0, 2).valid(true) && !Props(4, 1, 2).valid(true) && Props(4, 1, 2).valid());
		LZK_ALWAYS_ASSERT(Props(3, 0, 2).GetNumProbs() == 1984 + 0x300 * 8);
	}
} _test_lzma_state;

struct test_lzma_raw {
	static void round_trip(const_memory_block data, const Encoder::EncProps &props) {
		dynamic_array<uint8>	packed, unpacked;
		LZK_ALWAYS_ASSERT(encode(packed, data, props) == OK);
		LZK_ALWAYS_ASSERT(packed.size() >= 5 && packed[0] == 0);

		errors	err = decode(unpacked, packed, props, props.dict_size, props.eos ? UNKNOWN_SIZE : data.length());
		LZK_ALWAYS_ASSERT(err == OK);
		LZK_ALWAYS_ASSERT(same(unpacked, data));
	}

	test_lzma_raw() {
		auto	text	= get_mixed_data(100000);
		auto	noise	= get_random_data(20000);

		Encoder::EncProps	normal;
		Encoder::EncProps	fast	= Encoder::EncProps::Preset(1);
		Encoder::EncProps	wide(1 << 16);
		wide.lc	= 8;
		wide.lp	= 4;
		wide.pb	= 4;
		Encoder::EncProps	narrow(1 << 12, 273, 16);
		narrow.lc = 0;
		narrow.lp = 2;
		narrow.pb = 0;

		for (auto &props : {normal, fast, wide, narrow}) {
			round_trip(text, props);
			round_trip(noise, props);
			round_trip(get_test_data(), props);
			round_trip(const_memory_block(), props);
			round_trip("x", props);
		}

		// compression actually happens
		dynamic_array<uint8>	packed;
		LZK_ALWAYS_ASSERT(encode(packed, text, normal) == OK);
		LZK_ALWAYS_ASSERT(packed.size() < text.size() / 2);

		// end marker, no size
		Encoder::EncProps	eos;
		eos.eos = true;
		round_trip(text, eos);
		round_trip(const_memory_block(), eos);

		// without the marker a stream of unknown size cannot end cleanly
		dynamic_array<uint8>	out;
		LZK_ALWAYS_ASSERT(decode(out, packed, normal, normal.dict_size) != OK);

		// a cut stream
		dynamic_array<uint8>	cut(packed.begin(), packed.begin() + packed.size() / 2);
		LZK_ALWAYS_ASSERT(decode(out, cut, normal, normal.dict_size, text.size()) == ERROR_TRUNCATED);

		// same input, same output
		dynamic_array<uint8>	again;
		LZK_ALWAYS_ASSERT(encode(again, text, normal) == OK && same(again, packed));

		// probabilities never leave their range
		Encoder	enc(normal);
		LZK_ALWAYS_ASSERT(enc.Encode(again, text) == OK && probs_in_range(enc));

		Decoder		dec(normal);
		Dictionary	dict(normal.dict_size);
		byte_reader	file(packed);
		bool		eos_found;
		LZK_ALWAYS_ASSERT(dec.Decode(dict, file, text.size(), eos_found, true) == OK && !eos_found && probs_in_range(dec));
		LZK_ALWAYS_ASSERT(same(dict.buffer, text));
	}
} _test_lzma_raw;

struct test_lzma_params {
	test_lzma_params() {
		Encoder::EncProps	p0 = Encoder::EncProps::Preset(0);
		Encoder::EncProps	p9 = Encoder::EncProps::Preset(9);
		LZK_ALWAYS_ASSERT(p0.fast && p0.dict_size == 1 << 16 && p0.chain_len == 32);
		LZK_ALWAYS_ASSERT(!p9.fast && p9.dict_size == 16 << 20 && p9.nice_len == 273 && p9.chain_len == 273);
		LZK_ALWAYS_ASSERT(Encoder::EncProps::Preset(5).dict_size == 4 << 20 && Encoder::EncProps::Preset(5).chain_len == 64);
		for (int i = 0; i < 10; i++)
			LZK_ALWAYS_ASSERT(Encoder::EncProps::Preset(i).Validate(true) == OK);

		Encoder::EncProps	bad;
		bad.nice_len = 4;
		LZK_ALWAYS_ASSERT(bad.Validate(false) == ERROR_PARAM);
		bad = Encoder::EncProps(1024);
		LZK_ALWAYS_ASSERT(bad.Validate(false) == ERROR_PARAM);
		bad = Encoder::EncProps();
		bad.lc = 4;
		bad.lp = 1;
		LZK_ALWAYS_ASSERT(bad.Validate(false) == OK && bad.Validate(true) == ERROR_PARAM);
		bad.lc = 9;
		dynamic_array<uint8>	out;
		LZK_ALWAYS_ASSERT(encode(out, "abc", bad) == ERROR_PARAM && out.empty());

		uint8	header[5];
		Encoder	enc(Encoder::EncProps(1 << 20));
		enc.WriteProperties(header);
		LZK_ALWAYS_ASSERT(header[0] == 93 && load_le<uint32>(header + 1) == 1 << 20);

		LZK_ALWAYS_ASSERT(error_string(ERROR_DISTANCE) != error_string(ERROR_DATA));
	}
} _test_lzma_params;

struct test_lzma_alone {
	test_lzma_alone() {
		auto	text	= get_mixed_data(50000, 3);
		dynamic_array<uint8>	packed, out;

		Encoder::EncProps	props(1 << 16);
		LZK_ALWAYS_ASSERT(alone::encode(packed, text, props) == OK);
		LZK_ALWAYS_ASSERT(packed.size() > Alone::HEADER_SIZE && packed[0] == 93);
		LZK_ALWAYS_ASSERT(load_le<uint32>(packed.begin() + 1) == 1 << 16 && load_le<uint64>(packed.begin() + 5) == text.size());
		LZK_ALWAYS_ASSERT(alone::decode(out, packed) == OK && same(out, text));

		// unknown size
		packed.clear();
		LZK_ALWAYS_ASSERT(alone::encode(packed, text, props, false) == OK);
		LZK_ALWAYS_ASSERT(load_le<uint64>(packed.begin() + 5) == UNKNOWN_SIZE);
		LZK_ALWAYS_ASSERT(alone::decode(out, packed) == OK && same(out, text));

		// bad headers
		LZK_ALWAYS_ASSERT(alone::decode(out, const_memory_block(packed.begin(), 12)) == ERROR_TRUNCATED);
		packed[0] = 225;
		LZK_ALWAYS_ASSERT(alone::decode(out, packed) == ERROR_PROPS);
	}
} _test_lzma_alone;
