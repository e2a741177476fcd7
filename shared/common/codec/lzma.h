#ifndef LZMA_H
#define LZMA_H

#include "codec.h"
#include "window.h"
#include "stream.h"

namespace lzma {
using namespace lzk;

enum errors {
	OK					= 0,
	ERROR_DATA,			// range coder payload inconsistent
	ERROR_CONTROL,		// unknown LZMA2 control byte
	ERROR_CHUNK_SIZE,	// decoded past the declared uncompressed size
	ERROR_TRUNCATED,	// input ended mid header or mid payload
	ERROR_DISTANCE,		// match distance outside the dictionary
	ERROR_PROPS,		// properties missing or out of range
	ERROR_RESET,		// missing dictionary or state reset
	ERROR_PARAM,		// bad encoder parameters
};

const char*	error_string(errors e);

static const uint64	UNKNOWN_SIZE = ~uint64(0);

//-----------------------------------------------------------------------------
// adaptive bit models
//	a prob_t is the chance of a 0 in 1/2048ths; each coded bit moves it 1/32 of the way towards that bit
//-----------------------------------------------------------------------------

typedef uint16	prob_t;

enum {
	PROB_BITS	= 11,
	PROB_ONE	= 1 << PROB_BITS,
	PROB_INIT	= PROB_ONE / 2,
	PROB_MOVE	= 5,
	RANGE_TOP	= 1 << 24,
};

inline bool adapt(prob_t &p, bool bit) {
	if (bit)
		p -= p >> PROB_MOVE;
	else
		p += (PROB_ONE - p) >> PROB_MOVE;
	return bit;
}

//-----------------------------------------------------------------------------
// RangeDecoder
//	bit trees keep node 1 as the root, the children of node n are 2n and 2n + 1
//-----------------------------------------------------------------------------

template<typename S> struct RangeDecoder {
	S		file;
	uint32	range, code;

	RangeDecoder(S file) : file(file), range(~0u), code(0) {}

	// every stream opens with a zero byte, then four bytes of code
	bool	start() {
		bool	lead = file.getc() == 0;
		for (int i = 0; i < 4; i++)
			code = (code << 8) | uint8(file.getc());
		return lead && code != range;
	}

	void	normalise() {
		if (range < RANGE_TOP) {
			range	<<= 8;
			code	= (code << 8) | uint8(file.getc());
		}
	}

	bool	bit(prob_t &p) {
		normalise();
		uint32	bound = (range >> PROB_BITS) * p;
		if (code < bound) {
			range	= bound;
			return adapt(p, false);
		}
		range	-= bound;
		code	-= bound;
		return adapt(p, true);
	}

	// even odds, no model
	bool	direct() {
		normalise();
		range >>= 1;
		if (code < range)
			return false;
		code -= range;
		return true;
	}
	uint32	direct(uint32 n) {
		uint32	v = 0;
		while (n--)
			v = (v << 1) | uint32(direct());
		return v;
	}

	// n bits, top bit first
	uint32	tree(prob_t *probs, uint32 n) {
		uint32	node = 1;
		for (uint32 i = 0; i < n; i++)
			node = (node << 1) | uint32(bit(probs[node]));
		return node - (1u << n);
	}

	// n bits, bottom bit first
	uint32	tree_reverse(prob_t *probs, uint32 n) {
		uint32	node = 1, v = 0;
		for (uint32 i = 0; i < n; i++) {
			uint32	b = bit(probs[node]);
			node	= (node << 1) | b;
			v		|= b << i;
		}
		return v;
	}

	// a literal whose bits are modelled against the byte at rep0 until the first bit that differs
	uint32	literal_matched(prob_t *probs, uint32 match) {
		uint32	node = 1;
		while (node < 0x100) {
			uint32	mb	= (match >> 7) & 1;
			uint32	b	= bit(probs[((1 + mb) << 8) + node]);
			match	<<= 1;
			node	= (node << 1) | b;
			if (b != mb)
				break;
		}
		while (node < 0x100)
			node = (node << 1) | uint32(bit(probs[node]));
		return node & 0xff;
	}
};

//-----------------------------------------------------------------------------
// RangeEncoder
//-----------------------------------------------------------------------------

template<typename S> struct RangeEncoder {
	S		file;
	uint64	low;
	uint32	range;
	uint8	cache;		// last byte that a carry could still change
	uint64	pending;	// cache plus the 0xFF bytes queued behind it

	RangeEncoder(S file) : file(file), low(0), range(~0u), cache(0), pending(1) {}

	// bytes emitted or pending, not counting the flush
	size_t	tell()	const	{ return file.tell() + size_t(pending); }

	void	shift_low() {
		if (uint32(low) < 0xFF000000u || (low >> 32) != 0) {
			uint8	carry = uint8(low >> 32);
			for (uint8 b = cache; pending; b = 0xFF, --pending)
				file.putc(uint8(b + carry));
			cache = uint8(uint32(low) >> 24);
		}
		++pending;
		low = uint32(low) << 8;
	}

	void	normalise() {
		if (range < RANGE_TOP) {
			range <<= 8;
			shift_low();
		}
	}

	void	flush() {
		for (int i = 0; i < 5; i++)
			shift_low();
	}

	void	bit(prob_t &p, bool b) {
		uint32	bound = (range >> PROB_BITS) * p;
		if (b) {
			low		+= bound;
			range	-= bound;
		} else {
			range	= bound;
		}
		adapt(p, b);
		normalise();
	}

	// the low n bits of v, top first, at even odds
	void	direct(uint32 v, uint32 n) {
		while (n--) {
			range >>= 1;
			if ((v >> n) & 1)
				low += range;
			normalise();
		}
	}

	void	tree(prob_t *probs, uint32 n, uint32 v) {
		uint32	node = 1;
		while (n--) {
			uint32	b = (v >> n) & 1;
			bit(probs[node], b);
			node = (node << 1) | b;
		}
	}

	void	tree_reverse(prob_t *probs, uint32 n, uint32 v) {
		uint32	node = 1;
		for (uint32 i = 0; i < n; i++) {
			uint32	b = (v >> i) & 1;
			bit(probs[node], b);
			node = (node << 1) | b;
		}
	}

	void	literal_matched(prob_t *probs, uint32 v, uint32 match) {
		uint32	node	= 1;
		bool	same	= true;
		for (int i = 8; i--;) {
			uint32	b	= (v >> i) & 1;
			if (same) {
				uint32	mb	= (match >> i) & 1;
				bit(probs[((1 + mb) << 8) + node], b);
				same	= b == mb;
			} else {
				bit(probs[node], b);
			}
			node = (node << 1) | b;
		}
	}
};

//-----------------------------------------------------------------------------
// PriceTable
//	estimated cost of coding a bit, in 1/16ths of a bit, looked up by probability / 16
//-----------------------------------------------------------------------------

struct PriceTable {
	enum {
		BIT			= 16,		// one bit at even odds
		BUCKET_BITS	= 4,
		SIZE		= PROB_ONE >> BUCKET_BITS,
	};

	uint32	prices[SIZE];

	// floor(log2(x) * BIT) for 0 < x < 1 << 16, by repeated squaring of the mantissa
	static constexpr uint32	log2_units(uint32 x) {
		uint32	whole = 0;
		while (x >> (whole + 1))
			++whole;

		uint64	m		= uint64(x) << (30 - whole);	// 1.0 is 1 << 30
		uint32	frac	= 0;
		for (uint32 i = 1; i < BIT; i <<= 1) {
			m		= (m * m) >> 30;
			frac	<<= 1;
			if (m >> 31) {
				m		>>= 1;
				frac	|= 1;
			}
		}
		return whole * BIT + frac;
	}

	constexpr PriceTable() : prices() {
		for (uint32 i = 0; i < SIZE; i++)
			prices[i] = PROB_BITS * BIT - log2_units((i << BUCKET_BITS) + (1 << (BUCKET_BITS - 1)));
	}

	uint32	price0(prob_t p)			const	{ return prices[p >> BUCKET_BITS]; }
	uint32	price1(prob_t p)			const	{ return prices[(PROB_ONE - 1 - p) >> BUCKET_BITS]; }
	uint32	price(prob_t p, bool b)		const	{ return b ? price1(p) : price0(p); }

	uint32	tree(const prob_t *probs, uint32 n, uint32 v) const {
		uint32	total = 0;
		for (uint32 node = v | (1u << n); node > 1; node >>= 1)
			total += price(probs[node >> 1], node & 1);
		return total;
	}

	uint32	tree_reverse(const prob_t *probs, uint32 n, uint32 v) const {
		uint32	total = 0, node = 1;
		for (uint32 i = 0; i < n; i++) {
			uint32	b = (v >> i) & 1;
			total	+= price(probs[node], b);
			node	= (node << 1) | b;
		}
		return total;
	}

	uint32	literal_matched(const prob_t *probs, uint32 v, uint32 match) const {
		uint32	total	= 0, node = 1;
		bool	same	= true;
		for (int i = 8; i--;) {
			uint32	b	= (v >> i) & 1;
			if (same) {
				uint32	mb	= (match >> i) & 1;
				total	+= price(probs[((1 + mb) << 8) + node], b);
				same	= b == mb;
			} else {
				total	+= price(probs[node], b);
			}
			node = (node << 1) | b;
		}
		return total;
	}

	// prices of all 1 << n symbols of a tree, n <= 8, summed down from the root
	void	fill_tree(uint32 *out, const prob_t *probs, uint32 n) const {
		uint32	cost[1 << 9];
		cost[1] = 0;
		for (uint32 node = 1; node < (1u << n); node++) {
			cost[node * 2 + 0]	= cost[node] + price0(probs[node]);
			cost[node * 2 + 1]	= cost[node] + price1(probs[node]);
		}
		for (uint32 i = 0; i < (1u << n); i++)
			out[i] = cost[(1u << n) + i];
	}
};

//-----------------------------------------------------------------------------
// LZMA State
//-----------------------------------------------------------------------------

struct State {
	enum STATES {//			on lit			on match	on rep		on shortrep
		LIT,				//LIT			MATCH		REP			SHORTREP
		MATCH_LIT_LIT,		//LIT			MATCH		REP			SHORTREP
		REP_LIT_LIT,		//LIT			MATCH		REP			SHORTREP
		SHORTREP_LIT_LIT,	//LIT			MATCH		REP			SHORTREP
		MATCH_LIT,			//MATCH_LIT_LIT	MATCH		REP			SHORTREP
		REP_LIT,			//REP_LIT_LIT	MATCH		REP			SHORTREP
		SHORTREP_LIT,		//SHORTREP_LIT_LIT MATCH	REP			SHORTREP
		MATCH,				//MATCH_LIT		MATCH2		REP2		REP2
		REP,				//REP_LIT		MATCH2		REP2		REP2
		SHORTREP,			//SHORTREP_LIT	MATCH2		REP2		REP2
		MATCH2,				//MATCH_LIT		MATCH2		REP2		REP2
		REP2,				//REP_LIT		MATCH2		REP2		REP2
		NUM_STATES,
		NUM_STATES2			= 16,
		LIT_STATES			= MATCH,
	};

	enum {
		NUM_REPS			= 4,

		//char
		CharBitsMax			= 8,

		//pos
		PosBitsMax			= 4,
		PosStatesMax		= 1 << PosBitsMax,
		LenToPosStates		= 4,
		PosSlotBits			= 6,
		AlignBits			= 4,

		StartPosModelIndex	= 4,
		EndPosModelIndex	= 14,
		NumFullDistances	= 1 << (EndPosModelIndex >> 1),

		//length
		LenLowBits			= 3,
		LenLowSymbols		= 1 << LenLowBits,
		LenHighBits			= 8,
		LenHighSymbols		= 1 << LenHighBits,
		LenSymbolsTotal		= LenLowSymbols * 2 + LenHighSymbols,
		LenMin				= 2,
		LenMax				= LenMin + LenSymbolsTotal - 1,

		// LZMA2
		CharPosBitsMax		= 4,

		DictMin				= 1 << 12,
	};

	// offsets in probs table
	enum PROB : int {
		LenLow				= 0,
		LenMid				= LenLow + LenLowSymbols,
		LenHigh				= LenLow + 2 * (PosStatesMax << LenLowBits),
		LenTotal			= LenHigh + LenHighSymbols,

		ProbOffset			= 1664,
		SpecPos				= -ProbOffset,
		IsRep0Long			= SpecPos		+ NumFullDistances,
		RepLenCoder			= IsRep0Long	+ (NUM_STATES2 << PosBitsMax),
		LenCoder			= RepLenCoder	+ LenTotal,
		IsMatch				= LenCoder		+ LenTotal,
		PosAlign			= IsMatch		+ (NUM_STATES2 << PosBitsMax),
		IsRep				= PosAlign		+ (1 << AlignBits),
		IsRepGT0			= IsRep			+ NUM_STATES,
		IsRepGT1			= IsRepGT0		+ NUM_STATES,
		IsRepGT2			= IsRepGT1		+ NUM_STATES,
		PosSlot				= IsRepGT2		+ NUM_STATES,
		Literal				= PosSlot		+ (LenToPosStates << PosSlotBits),
	};

	struct Props {
		uint8	lc, lp, pb;
		Props() : lc(3), lp(0), pb(2) {}
		Props(uint8 lc, uint8 lp, uint8 pb) : lc(lc), lp(lp), pb(pb) {}
		explicit Props(uint8 b) {
			lc	= b % (CharBitsMax + 1);
			b	/= (CharBitsMax + 1);
			lp	= b % (PosBitsMax + 1);
			pb	= b / (PosBitsMax + 1);
		}
		// LZMA2 restricts lc + lp so the literal coder stays small
		bool		valid(bool lzma2 = false) const {
			return lc <= CharBitsMax && lp <= PosBitsMax && pb <= PosBitsMax && (!lzma2 || lc + lp <= CharPosBitsMax);
		}
		uint32		GetNumProbs()	const	{ return Literal + ProbOffset + (0x300 << (lc + lp)); }
		uint32		lp_mask()		const	{ return (0x100 << lp) - (0x100 >> lc); }
		uint32		pb_mask()		const	{ return bits(pb); }
		uint8		encode()		const	{ return uint8((pb * (PosBitsMax + 1) + lp) * (CharBitsMax + 1) + lc); }
		bool		operator==(const Props &b) const { return lc == b.lc && lp == b.lp && pb == b.pb; }
	};

	struct LiteralHelper {
		uint32			lp_mask, lc;
		LiteralHelper(Props props) : lp_mask(props.lp_mask()), lc(props.lc) {}
		uint32	operator()(uint64 pos, uint8 prev) const { return (((uint32(pos << 8) + prev) & lp_mask) << lc) * 3; }
	};

	static constexpr uint32	GetLenToPosState(uint32 len)		{ return len - 2 < LenToPosStates - 1 ? len - 2 : LenToPosStates - 1; }
	static uint32			GetPosSlot(uint32 pos)				{ if (pos < 2) return pos; auto i = highest_set_index(pos); return (i + i) + ((pos >> (i - 1)) & 1); }
	// index relative to IsMatch or IsRep0Long, both of which are negative offsets
	static constexpr int	PosState(uint32 state, uint32 pos)	{ return int(pos * NUM_STATES2 + state); }

	static constexpr bool	IsLitState(uint32 s)				{ return s < LIT_STATES; }
	static constexpr uint32 NextLitState(uint32 s)				{ return s < MATCH_LIT ? LIT : s < MATCH2 ? s - 3 : s - 6; }
	static constexpr uint32 NextMatchState(uint32 s)			{ return s < LIT_STATES ? MATCH : MATCH2; }
	static constexpr uint32 NextRepState(uint32 s)				{ return s < LIT_STATES ? REP : REP2; }
	static constexpr uint32 NextShortRepState(uint32 s)			{ return s < LIT_STATES ? SHORTREP : REP2; }

	dynamic_array<prob_t>	probability;
	uint32					state;
	uint32					reps[NUM_REPS];	// distances, not distance - 1

	prob_t*			probs()			{ return probability.begin() + ProbOffset; }
	const prob_t*	probs()	const	{ return probability.begin() + ProbOffset; }

	void	Reset() {
		probability.fill(PROB_INIT);
		reps[0]	= reps[1] = reps[2] = reps[3] = 1;
		state	= LIT;
	}
};

typedef State::Props	Props;

//-----------------------------------------------------------------------------
// LZMA decoder
//-----------------------------------------------------------------------------

struct Decoder : State {
	typedef RangeDecoder<byte_reader&>	decoder;

	Props			prop;

	void	SetProps(Props propNew) {
		probability.resize(propNew.GetNumProbs());
		prop = propNew;
		State::Reset();
	}

	static uint32	DecodeLength(decoder &rc, prob_t *lc, uint32 ps);
	static uint32	DecodeDistance(decoder &rc, prob_t *probs, uint32 lps);

	// decodes until unpack_size bytes have been appended to dict (or an end marker if allowed)
	errors	Process(Dictionary &dict, decoder &rc, uint64 unpack_size, bool &eos);
	// one complete range coded stream; strict also requires the coder to end exactly on the last input byte
	errors	Decode(Dictionary &dict, byte_reader &file, uint64 unpack_size, bool &eos, bool strict);

	Decoder(Props props = Props()) {
		SetProps(props);
	}
};

//-----------------------------------------------------------------------------
// MatchFinder
//-----------------------------------------------------------------------------

struct MatchFinder {
	enum {
		HASH_BITS2	= 10,
		HASH_BITS3	= 16,
		HASH_BITS4	= 20,
		HASH_SIZE	= (1 << HASH_BITS2) + (1 << HASH_BITS3) + (1 << HASH_BITS4),
		HASH_BYTES	= 4,
	};
	struct Match {
		uint32	len, dist;	// dist is distance - 1
	};

	Dictionary				window;
	dynamic_array<uint32>	head;		// heads of the hash chains, as position + 1
	dynamic_array<uint32>	chain;		// link to the previous position with the same 4 byte hash
	uint32					pos;		// search cursor
	uint32					nice_len;	// stop searching at this length
	uint32					chain_len;	// max hash chain hops

	uint32			avail()		const	{ return uint32(window.pos() - pos); }
	const uint8*	cur()		const	{ return window.data(pos); }
	uint32			dict_size()	const	{ return window.dict_size; }

	void			Reset();
	void			Feed(const_memory_block b);
	uint32			GetMatches(Match *matches);
	void			Skip(uint32 n);
	dynamic_array<Match>	FindMatches();

	MatchFinder(uint32 dict_size, uint32 nice_len = 32, uint32 chain_len = 32) : window(dict_size), head(HASH_SIZE), pos(0), nice_len(nice_len), chain_len(chain_len) {}
private:
	void			Hash(uint32 &h2, uint32 &h3, uint32 &h4) const;
};

//-----------------------------------------------------------------------------
// LZMA Encoder
//-----------------------------------------------------------------------------

struct Encoder : State {
	enum {
		OPT_SIZE		= 1 << 11,	// furthest the optimal parse looks ahead
		PRICE_REFRESH	= 64,		// lengths coded between length and distance price rebuilds
		INFINITE		= 1 << 30,
	};
	// a step's back is LITERAL, a rep index, or distance - 1 + NUM_REPS; a short rep is rep 0 with length 1
	static constexpr uint32	LITERAL = ~0u;

	struct EncProps : Props {
		uint32	dict_size;		// DictMin <= dict_size
		uint32	nice_len;		// 5 <= nice_len <= LenMax; a match this long is taken without looking further
		uint32	chain_len;		// hash chain hops per position
		bool	fast;			// greedy parse
		bool	eos;			// raw streams only: finish with an end marker

		EncProps(uint32 dict_size = 1 << 22, uint32 nice_len = 32, uint32 chain_len = 64, bool fast = false)
			: dict_size(dict_size), nice_len(nice_len), chain_len(chain_len), fast(fast), eos(false) {}

		static EncProps	Preset(int level);
		errors			Validate(bool lzma2) const;
	};

	typedef RangeEncoder<byte_writer>	encoder;

	struct Step {
		uint32	len, back;
	};

	// cheapest known way to reach a position of the parse
	//	lead == 0	: one step (back, len)
	//	lead == 1	: LITERAL then REP0 (len)
	//	lead > 1	: (lead_back, lead - 1) then LITERAL then REP0 (len)
	struct Node {
		uint32	price;
		uint32	len, back;
		uint32	lead, lead_back;
		uint32	state;
		uint32	reps[NUM_REPS];

		void	Clear()	{ price = INFINITE; len = 0; }
		bool	Improve(uint32 p, uint32 l, uint32 b, uint32 ld = 0, uint32 lb = 0) {
			if (p >= price)
				return false;
			price		= p;
			len			= l;
			back		= b;
			lead		= ld;
			lead_back	= lb;
			return true;
		}
	};

	static const PriceTable	bit_prices;

	MatchFinder		match_finder;
	EncProps		props;
	uint64			position;	// next byte to code, from the last Reset

	uint32			align_prices[1 << AlignBits];
	uint32			pos_slot_prices[LenToPosStates][1 << PosSlotBits];
	uint32			dist_prices[LenToPosStates][NumFullDistances];
	uint32			len_prices[PosStatesMax][LenSymbolsTotal];
	uint32			replen_prices[PosStatesMax][LenSymbolsTotal];
	uint32			len_count, replen_count;

	Node			nodes[OPT_SIZE];
	Step			path[OPT_SIZE];
	uint32			path_pos, path_end;		// steps chosen but not yet coded
	uint32			lookahead;				// bytes the match finder is ahead of position
	uint32			num_found;				// matches[] holds the matches at position when lookahead is 1
	MatchFinder::Match	matches[LenMax + 2];

	uint32	ReadMatches() {
		++lookahead;
		return num_found = match_finder.GetMatches(matches);
	}
	void	Skip(uint32 n) {
		lookahead += n;
		match_finder.Skip(n);
	}
	uint32	avail_at(uint32 at) const {
		return uint32(match_finder.window.pos() - at);
	}

	// price tables
	void	FillLengthPrices(uint32 prices[PosStatesMax][LenSymbolsTotal], const prob_t *lc);
	void	FillDistancePrices();
	void	RefreshPrices();
	void	InitPrices() {
		len_count = replen_count = PRICE_REFRESH;
	}

	uint32	LiteralPrice(uint32 at, uint32 state, const uint8 *data, uint32 rep0) const;
	uint32	ShortRepPrice(uint32 state, uint32 ps) const {
		const prob_t	*probs = this->probs();
		return	bit_prices.price0(probs[IsRepGT0 + state])
			+	bit_prices.price0(probs[IsRep0Long + PosState(state, ps)]);
	}
	// all of the decision bits of a rep 0 match
	uint32	Rep0Price(uint32 state, uint32 ps) const {
		const prob_t	*probs = this->probs();
		return	bit_prices.price1(probs[IsMatch + PosState(state, ps)])
			+	bit_prices.price1(probs[IsRep + state])
			+	bit_prices.price0(probs[IsRepGT0 + state])
			+	bit_prices.price1(probs[IsRep0Long + PosState(state, ps)]);
	}
	// rep index bits only
	uint32	RepPrice(uint32 rep, uint32 state, uint32 ps) const;
	uint32	DistPrice(uint32 dist, uint32 len) const;

	// parsing
	static void	Apply(uint32 &state, uint32 *reps, uint32 back, uint32 len);
	void		Arrive(uint32 i);
	uint32		Parse(uint32 at, uint32 &back);
	uint32		ParseFast(uint32 &back);
	uint32		NextStep(uint32 &back);

	// coding
	static void	EncodeLength(encoder &rc, prob_t *lc, uint32 sym, uint32 ps);
	static void	EncodeDistance(encoder &rc, prob_t *probs, uint32 dist, uint32 lps);
	void		EncodeLiteral(encoder &rc);
	void		EncodeMatch(encoder &rc, uint32 dist, uint32 len, uint32 ps);
	void		EncodeRep(encoder &rc, uint32 rep, uint32 len, uint32 ps);

	// encodes from the cursor until the input runs out or a limit is near; limits of 0 mean none
	void	CodeOneBlock(encoder &rc, uint32 maxPackSize, uint32 maxUnpackSize);
	void	WriteEndMarker(encoder &rc);
	void	WriteProperties(uint8 header[5]) const;

	// state, probabilities and reps
	void	Init();
	// forget the dictionary too
	void	Reset();
	void	Feed(const_memory_block src)	{ match_finder.Feed(src); }
	uint32	remaining()				const	{ return match_finder.avail(); }

	errors	Encode(dynamic_array<uint8> &out, const_memory_block src);

	Encoder(const EncProps &props = EncProps()) : match_finder(props.dict_size, props.nice_len, props.chain_len), props(props), position(0) {
		probability.resize(props.valid() ? props.GetNumProbs() : 0);
		Init();
		InitPrices();
	}
};

//-----------------------------------------------------------------------------
// raw streams
//-----------------------------------------------------------------------------

errors	encode(dynamic_array<uint8> &out, const_memory_block src, const Encoder::EncProps &props);
errors	decode(dynamic_array<uint8> &out, const_memory_block src, Props props, uint32 dict_size, uint64 unpack_size = UNKNOWN_SIZE);

}  // namespace lzma
#endif	// LZMA_H
