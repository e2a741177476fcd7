#include "lzma_alone.h"

using namespace lzma;

void Alone::write(uint8 header[HEADER_SIZE]) const {
	header[0] = props.encode();
	store_le<uint32>(header + 1, dict_size);
	store_le<uint64>(header + 5, unpack_size);
}

errors Alone::read(byte_reader &file) {
	const uint8	*header = file.get_block(HEADER_SIZE);
	if (!header) {
		LZK_TRACEF("lzma: header needs %d bytes\n", HEADER_SIZE);
		return ERROR_TRUNCATED;
	}

	props = Props(header[0]);
	if (!props.valid()) {
		LZK_TRACEF("lzma: bad properties byte %02x\n", header[0]);
		return ERROR_PROPS;
	}
	dict_size	= load_le<uint32>(header + 1);
	unpack_size	= load_le<uint64>(header + 5);
	return OK;
}

errors lzma::alone::encode(dynamic_array<uint8> &out, const_memory_block src, const Encoder::EncProps &props, bool known_size) {
	if (errors e = props.Validate(false))
		return e;

	Alone	hdr;
	hdr.props		= props;
	hdr.dict_size	= props.dict_size;
	hdr.unpack_size	= known_size ? src.length() : UNKNOWN_SIZE;
	hdr.write(out.expand(Alone::HEADER_SIZE));

	Encoder::EncProps	props2	= props;
	props2.eos	= !known_size;
	return lzma::encode(out, src, props2);
}

errors lzma::alone::decode(dynamic_array<uint8> &out, const_memory_block src) {
	byte_reader	file(src);
	Alone		hdr;
	if (errors e = hdr.read(file))
		return e;
	return lzma::decode(out, const_memory_block(file.p, file.end), hdr.props, hdr.dict_size, hdr.unpack_size);
}
