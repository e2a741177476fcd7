#include "lzma2.h"

using namespace lzma;

uint8 LZMA2::dic_prop_from_size(uint32 size) {
	uint8	p = 0;
	while (p < DIC_PROP_MAX && dic_size_from_prop(p) < size)
		++p;
	return p;
}

//-----------------------------------------------------------------------------
// chunk headers
//-----------------------------------------------------------------------------

ChunkReader::HeaderState ChunkReader::UpdateHeaderState(uint8 b) {
	switch (header_state) {
		case HEAD_CONTROL:
			control = b;
			if (control.end())
				return HEAD_FINISHED;

			if (!control.valid()) {
				LZK_TRACEF("lzma2: bad control byte %02x\n", b);
				header_error = ERROR_CONTROL;
				return HEAD_ERROR;
			}
			unpack_size = control.lzma() ? control.size() << 16 : 0;
			pack_size	= 0;
			return HEAD_UNPACK0;

		case HEAD_UNPACK0:
			unpack_size |= (uint32)b << 8;
			return HEAD_UNPACK1;

		case HEAD_UNPACK1:
			unpack_size += (uint32)b + 1;
			if (control.lzma())
				return HEAD_PACK0;
			pack_size = unpack_size;
			return HEAD_DATA;

		case HEAD_PACK0:
			pack_size = (uint32)b << 8;
			return HEAD_PACK1;

		case HEAD_PACK1:
			pack_size += (uint32)b + 1;
			return control.mode() >= RESET_PROPS ? HEAD_PROP : HEAD_DATA;

		case HEAD_PROP:
			chunk_props = Props(b);
			if (!chunk_props.valid(true)) {
				LZK_TRACEF("lzma2: bad properties byte %02x\n", b);
				header_error = ERROR_PROPS;
				return HEAD_ERROR;
			}
			return HEAD_DATA;

		default:
			return header_state;
	}
}

errors ChunkReader::Next(byte_reader &file, Chunk &chunk) {
	header_state	= HEAD_CONTROL;
	header_error	= OK;

	while (header_state != HEAD_DATA && header_state != HEAD_FINISHED) {
		if (file.eof()) {
			LZK_TRACEF("lzma2: stream ends inside a chunk header\n");
			return ERROR_TRUNCATED;
		}
		header_state = UpdateHeaderState(uint8(file.getc()));
		if (header_state == HEAD_ERROR)
			return header_error;
	}

	chunk = Chunk();
	if (header_state == HEAD_FINISHED)
		return OK;

	const uint8	*data = file.get_block(pack_size);
	if (!data) {
		LZK_TRACEF("lzma2: chunk needs %u bytes, %u left\n", pack_size, uint32(file.remaining()));
		return ERROR_TRUNCATED;
	}

	chunk.type			= control.lzma() ? Chunk::LZMA : Chunk::COPY;
	chunk.dict_reset	= control.reset_dic();
	chunk.state_reset	= control.lzma() && control.mode() >= RESET_STATE;
	chunk.new_props		= control.lzma() && control.mode() >= RESET_PROPS;
	if (chunk.new_props)
		chunk.props		= chunk_props;
	chunk.unpack_size	= unpack_size;
	chunk.pack_size		= pack_size;
	chunk.data			= const_memory_block(data, pack_size);
	return OK;
}

errors lzma::parse_chunks(const_memory_block stream, dynamic_array<Chunk> &chunks) {
	ChunkReader	reader;
	byte_reader	file(stream);
	for (;;) {
		Chunk	chunk;
		if (errors e = reader.Next(file, chunk))
			return e;
		chunks.push_back(chunk);
		if (chunk.type == Chunk::END)
			return OK;
	}
}

//-----------------------------------------------------------------------------
// LZMA2 decoder
//-----------------------------------------------------------------------------

errors Decoder2::DecodeChunk(Dictionary &dict, const Chunk &chunk) {
	if (needInitDic && !chunk.dict_reset) {
		LZK_TRACEF("lzma2: first chunk does not reset the dictionary\n");
		return ERROR_RESET;
	}

	if (chunk.dict_reset) {
		dict.reset();
		needInitDic = false;
	}

	if (chunk.type == Chunk::COPY) {
		if (chunk.dict_reset)
			needInitProp = true;
		needInitState = true;
		dict.append(chunk.data.begin(), chunk.data.length());
		return OK;
	}

	if (needInitState && !chunk.state_reset) {
		LZK_TRACEF("lzma2: compressed chunk does not reset the state\n");
		return ERROR_RESET;
	}
	if (needInitProp && !chunk.new_props) {
		LZK_TRACEF("lzma2: compressed chunk without properties\n");
		return ERROR_PROPS;
	}

	if (chunk.new_props) {
		SetProps(chunk.props);
		needInitProp = false;
	} else if (chunk.state_reset) {
		State::Reset();
	}
	needInitState = false;

	byte_reader	file(chunk.data);
	bool		eos;
	errors		err = Decoder::Decode(dict, file, chunk.unpack_size, eos, true);
	if (err == OK && eos) {
		LZK_TRACEF("lzma2: end marker inside a chunk\n");
		err = ERROR_DATA;
	}
	return err;
}

errors Decoder2::Decode(dynamic_array<uint8> &out, const_memory_block src) {
	Dictionary	dict(dict_size);
	byte_reader	file(src);
	errors		err;

	for (;;) {
		Chunk	chunk;
		if ((err = Next(file, chunk)) != OK || chunk.type == Chunk::END)
			break;
		if ((err = DecodeChunk(dict, chunk)) != OK)
			break;
	}

	out.swap(dict.buffer);
	return err;
}

//-----------------------------------------------------------------------------
// LZMA2 Encoder
//-----------------------------------------------------------------------------

void Encoder2::WriteCopy(dynamic_array<uint8> &out, const uint8 *p, uint32 size) {
	while (size) {
		uint32	n = min(size, uint32(COPY_CHUNK_SIZE));
		uint8	header[3];
		header[0] = Control::Copy(needInitDic);
		store_be<uint16>(header + 1, uint16(n - 1));
		out.append(header, 3);
		out.append(p, n);
		needInitDic	= false;
		p		+= n;
		size	-= n;
	}
}

void Encoder2::EncodeBlock(dynamic_array<uint8> &out) {
	while (coder.remaining()) {
		if (needInitState)
			coder.Init();
		coder.InitPrices();

		uint64	start = coder.position;
		packed.clear();
		{
			byte_writer			w(packed);
			Encoder::encoder	rc(w);
			coder.CodeOneBlock(rc, PACK_SIZE_MAX, UNPACK_SIZE_MAX);
			rc.flush();
		}

		uint32	unpack	= uint32(coder.position - start);
		uint32	pack	= packed.size32();

		if (pack + 2 >= unpack || pack > PACK_SIZE_MAX) {
			// the coder has moved on, so the decoder must be told to reset before the next compressed chunk
			WriteCopy(out, coder.match_finder.window.data(size_t(start)), unpack);
			needInitState = true;
			continue;
		}

		MODE	mode = needInitDic ? RESET_DIC : needInitProp ? RESET_PROPS : needInitState ? RESET_STATE : RESET_NONE;
		uint8	header[6];
		header[0] = Control::Compress((unpack - 1) >> 16, mode);
		store_be<uint16>(header + 1, uint16(unpack - 1));
		store_be<uint16>(header + 3, uint16(pack - 1));
		header[5] = props.encode();

		out.append(header, mode >= RESET_PROPS ? 6 : 5);
		out.append(packed.begin(), pack);
		needInitDic = needInitProp = needInitState = false;
	}
}

errors Encoder2::Encode(dynamic_array<uint8> &out, const_memory_block src) {
	if (errors e = props.Validate(true))
		return e;

	while (!src.empty()) {
		const_memory_block	block = src.slice(0, min(src.length(), size_t(blocksize)));
		coder.Reset();
		coder.Feed(block);
		needInitDic = needInitState = needInitProp = true;
		EncodeBlock(out);
		src = src.slice(block.length());
	}

	out.push_back(0);
	return OK;
}

//-----------------------------------------------------------------------------
// entry points
//-----------------------------------------------------------------------------

errors lzma::lzma2_encode(dynamic_array<uint8> &out, const_memory_block data, const Encoder::EncProps &props, bool standalone, uint32 blocksize) {
	if (errors e = props.Validate(true))
		return e;

	if (standalone)
		out.push_back(LZMA2::dic_prop_from_size(props.dict_size));

	Encoder2	enc(props, blocksize);
	return enc.Encode(out, data);
}

errors lzma::lzma2_encode(dynamic_array<uint8> &out, const_memory_block data, uint32 dict_size, uint8 lc, uint8 lp, uint8 pb, bool standalone) {
	Encoder::EncProps	props(dict_size);
	props.lc	= lc;
	props.lp	= lp;
	props.pb	= pb;
	return lzma2_encode(out, data, props, standalone);
}

errors lzma::lzma2_decode(dynamic_array<uint8> &out, const_memory_block stream, uint32 dict_size, bool raw_mode) {
	if (!raw_mode) {
		if (stream.empty())
			return ERROR_TRUNCATED;

		uint8	p = stream.begin()[0];
		if (p > LZMA2::DIC_PROP_MAX) {
			LZK_TRACEF("lzma2: bad dictionary property %u\n", p);
			return ERROR_PROPS;
		}
		dict_size	= LZMA2::dic_size_from_prop(p);
		stream		= stream.slice(1);
	}

	Decoder2	dec(max(dict_size, uint32(State::DictMin)));
	return dec.Decode(out, stream);
}
