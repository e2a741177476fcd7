#ifndef LZMA2_H
#define LZMA2_H

#include "lzma.h"

namespace lzma {

//-----------------------------------------------------------------------------
// LZMA2 framing
//-----------------------------------------------------------------------------

struct LZMA2 {
	enum : uint32 {
		PACK_SIZE_MAX		= 1 << 16,
		UNPACK_SIZE_MAX		= 1 << 21,
		COPY_CHUNK_SIZE		= PACK_SIZE_MAX,
		DIC_PROP_MAX		= 40,
	};

	// what a compressed chunk resets before decoding; each level implies the ones before it
	enum MODE {
		RESET_NONE,
		RESET_STATE,
		RESET_PROPS,
		RESET_DIC,
	};

	struct Control {
		//00000000				-	EOS
		//00000001 U U			-	Uncompressed Reset Dic
		//00000010 U U			-	Uncompressed No Reset
		//100uuuuu U U P P		-	LZMA no reset
		//101uuuuu U U P P		-	LZMA reset state
		//110uuuuu U U P P S	-	LZMA reset state + new prop
		//111uuuuu U U P P S	-	LZMA reset state + new prop + reset dic
		//	u, U - Unpack Size
		//	P - Pack Size
		//	S - Props
		uint8	u;

		Control(uint8 u = 0) : u(u) {}
		bool	end()		const	{ return u == 0; }
		bool	lzma()		const	{ return !!(u & 0x80); }
		bool	valid()		const	{ return u <= 2 || lzma(); }
		MODE	mode()		const	{ return MODE((u >> 5) & 3); }
		uint32	size()		const	{ return u & 0x1f; }
		bool	reset_dic()	const	{ return lzma() ? mode() == RESET_DIC : u == 1; }
		operator uint8()	const	{ return u; }

		static Control Copy(bool reset_dic)					{ return Control(reset_dic ? 1 : 2); }
		static Control Compress(uint32 size_high, MODE mode)	{ return Control(uint8(0x80 | (mode << 5) | (size_high & 0x1f))); }
	};

	static uint32	dic_size_from_prop(uint32 p)	{ return p >= DIC_PROP_MAX ? 0xFFFFFFFFu : ((p & 1) | 2) << (p / 2 + 11); }
	static uint8	dic_prop_from_size(uint32 size);
};

struct Chunk {
	enum TYPE { END, COPY, LZMA };
	TYPE				type;
	bool				dict_reset;
	bool				state_reset;
	bool				new_props;
	Props				props;			// only meaningful with new_props
	uint32				unpack_size;
	uint32				pack_size;
	const_memory_block	data;

	Chunk() : type(END), dict_reset(false), state_reset(false), new_props(false), unpack_size(0), pack_size(0) {}
};

// reads chunk headers one byte at a time
struct ChunkReader : LZMA2 {
	enum HeaderState {
		HEAD_CONTROL,
		HEAD_UNPACK0,
		HEAD_UNPACK1,
		HEAD_PACK0,
		HEAD_PACK1,
		HEAD_PROP,
		HEAD_DATA,
		HEAD_FINISHED,
		HEAD_ERROR
	};

	HeaderState	header_state;
	errors		header_error;
	Control		control;
	uint32		unpack_size;
	uint32		pack_size;
	Props		chunk_props;

	HeaderState	UpdateHeaderState(uint8 b);
	// header and payload view of the next chunk; an END chunk for the terminating 0x00
	errors		Next(byte_reader &file, Chunk &chunk);

	ChunkReader() : header_state(HEAD_CONTROL), header_error(OK), unpack_size(0), pack_size(0) {}
};

errors	parse_chunks(const_memory_block stream, dynamic_array<Chunk> &chunks);

//-----------------------------------------------------------------------------
// LZMA2 decoder
//-----------------------------------------------------------------------------

struct Decoder2 : Decoder, ChunkReader {
	uint32	dict_size;
	bool	needInitDic, needInitState, needInitProp;

	errors	DecodeChunk(Dictionary &dict, const Chunk &chunk);
	errors	Decode(dynamic_array<uint8> &out, const_memory_block src);

	Decoder2(uint32 dict_size) : Decoder(Props(CharPosBitsMax, 0, 0)), dict_size(dict_size), needInitDic(true), needInitState(true), needInitProp(true) {}
};

//-----------------------------------------------------------------------------
// LZMA2 Encoder
//-----------------------------------------------------------------------------

struct Encoder2 : LZMA2 {
	enum : uint32 {
		BLOCK_SIZE_SOLID	= ~0u,
	};

	Encoder::EncProps		props;
	Encoder					coder;
	uint32					blocksize;	// input bytes between dictionary resets
	dynamic_array<uint8>	packed;
	bool					needInitDic, needInitState, needInitProp;

	errors	Encode(dynamic_array<uint8> &out, const_memory_block src);

	Encoder2(const Encoder::EncProps &props = Encoder::EncProps(), uint32 blocksize = BLOCK_SIZE_SOLID)
		: props(props), coder(props), blocksize(blocksize ? blocksize : uint32(BLOCK_SIZE_SOLID)), needInitDic(true), needInitState(true), needInitProp(true) {}

private:
	// chunks everything fed to the coder
	void	EncodeBlock(dynamic_array<uint8> &out);
	void	WriteCopy(dynamic_array<uint8> &out, const uint8 *p, uint32 size);
};

// standalone streams start with the dictionary property byte
errors	lzma2_encode(dynamic_array<uint8> &out, const_memory_block data, const Encoder::EncProps &props, bool standalone, uint32 blocksize = Encoder2::BLOCK_SIZE_SOLID);
errors	lzma2_encode(dynamic_array<uint8> &out, const_memory_block data, uint32 dict_size, uint8 lc, uint8 lp, uint8 pb, bool standalone);
// in raw mode dict_size comes from the container, otherwise from the stream's property byte
errors	lzma2_decode(dynamic_array<uint8> &out, const_memory_block stream, uint32 dict_size, bool raw_mode);

}  // namespace lzma
#endif	// LZMA2_H
