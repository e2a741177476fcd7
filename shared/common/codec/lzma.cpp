#include "lzma.h"

using namespace lzma;

const char *lzma::error_string(errors e) {
	static const char *names[] = {
		"ok",
		"corrupt data",
		"bad control byte",
		"chunk size exceeded",
		"truncated stream",
		"invalid distance",
		"bad properties",
		"missing reset",
		"bad parameters",
	};
	return unsigned(e) < num_elements(names) ? names[e] : "unknown error";
}

//-----------------------------------------------------------------------------
// LZMA decoder
//-----------------------------------------------------------------------------


uint32 Decoder::DecodeLength(decoder &rc, prob_t *lc, uint32 ps) {
	uint32	tree = ps << (1 + LenLowBits);
	if (!rc.bit(lc[LenLow]))
		return rc.tree(lc + LenLow + tree, LenLowBits);
	if (!rc.bit(lc[LenMid]))
		return rc.tree(lc + LenMid + tree, LenLowBits) + LenLowSymbols;
	return rc.tree(lc + LenHigh, LenHighBits) + LenLowSymbols * 2;
}

// returns distance - 1; 0xFFFFFFFF is the end marker
uint32 Decoder::DecodeDistance(decoder &rc, prob_t *probs, uint32 lps) {
	uint32	slot = rc.tree(probs + PosSlot + (lps << PosSlotBits), PosSlotBits);
	if (slot < StartPosModelIndex)
		return slot;

	uint32	footer	= (slot >> 1) - 1;
	uint32	dist	= (2 | (slot & 1)) << footer;
	if (slot < EndPosModelIndex)
		return dist + rc.tree_reverse(probs + SpecPos + dist, footer);

	dist += rc.direct(footer - AlignBits) << AlignBits;
	return dist + rc.tree_reverse(probs + PosAlign, AlignBits);
}

errors Decoder::Process(Dictionary &dict, decoder &rc, uint64 unpack_size, bool &eos) {
	LiteralHelper	lit(prop);
	uint32	pb_mask	= prop.pb_mask();
	prob_t	*probs	= this->probs();
	uint64	end		= unpack_size == UNKNOWN_SIZE ? UNKNOWN_SIZE : dict.pos() + unpack_size;
	errors	err		= OK;

	eos = false;
	while (dict.pos() < end) {
		if (rc.file.overrun) {
			err = ERROR_TRUNCATED;
			break;
		}

		uint64	at	= dict.pos();
		uint32	ps	= uint32(at) & pb_mask;

		if (!rc.bit(probs[IsMatch + PosState(state, ps)])) {
			prob_t	*p = probs + Literal + (at ? lit(at, dict.back(1)) : 0);
			uint32	c;
			if (IsLitState(state)) {
				c = rc.tree(p, 8);
			} else {
				if (!dict.valid(reps[0])) {
					err = ERROR_DISTANCE;
					break;
				}
				c = rc.literal_matched(p, dict.back(reps[0]));
			}
			dict.put(uint8(c));
			state = NextLitState(state);
			continue;
		}

		uint32	len;
		if (rc.bit(probs[IsRep + state])) {
			if (!rc.bit(probs[IsRepGT0 + state])) {
				if (!rc.bit(probs[IsRep0Long + PosState(state, ps)])) {
					if (!dict.valid(reps[0])) {
						err = ERROR_DISTANCE;
						break;
					}
					dict.put(dict.back(reps[0]));
					state = NextShortRepState(state);
					continue;
				}
			} else {
				uint32	i = !rc.bit(probs[IsRepGT1 + state]) ? 1 : !rc.bit(probs[IsRepGT2 + state]) ? 2 : 3;
				uint32	dist = reps[i];
				for (; i; --i)
					reps[i] = reps[i - 1];
				reps[0] = dist;
			}
			len		= DecodeLength(rc, probs + RepLenCoder, ps);
			state	= NextRepState(state);

		} else {
			len		= DecodeLength(rc, probs + LenCoder, ps);
			uint32	dist = DecodeDistance(rc, probs, GetLenToPosState(len + LenMin));
			if (dist == 0xFFFFFFFFu) {
				eos = true;
				break;
			}
			reps[3]	= reps[2];
			reps[2]	= reps[1];
			reps[1]	= reps[0];
			reps[0]	= dist + 1;
			state	= NextMatchState(state);
		}

		len += LenMin;
		if (!dict.valid(reps[0])) {
			LZK_TRACEF("lzma: distance %u at %llu\n", reps[0], (unsigned long long)at);
			err = ERROR_DISTANCE;
			break;
		}
		if (len > end - at) {
			err = ERROR_CHUNK_SIZE;
			break;
		}
		dict.copy(reps[0], len);
	}

	if (err == OK)
		rc.normalise();
	// whatever went wrong after the input ran out, the cause is the missing input
	if (rc.file.overrun)
		err = ERROR_TRUNCATED;
	return err;
}

errors Decoder::Decode(Dictionary &dict, byte_reader &file, uint64 unpack_size, bool &eos, bool strict) {
	eos = false;
	decoder	rc(file);
	if (!rc.start())
		return file.overrun ? ERROR_TRUNCATED : ERROR_DATA;

	errors	err = Process(dict, rc, unpack_size, eos);
	if (err == OK && strict && (rc.code != 0 || !file.eof())) {
		LZK_TRACEF("lzma: stream does not end cleanly (code=%08x, %u bytes left)\n", rc.code, uint32(file.remaining()));
		err = ERROR_DATA;
	}
	return err;
}

errors lzma::decode(dynamic_array<uint8> &out, const_memory_block src, Props props, uint32 dict_size, uint64 unpack_size) {
	if (!props.valid())
		return ERROR_PROPS;

	Decoder		dec(props);
	Dictionary	dict(max(dict_size, uint32(State::DictMin)));
	byte_reader	file(src);
	bool		eos;

	if (unpack_size != UNKNOWN_SIZE)
		dict.buffer.reserve(size_t(min(unpack_size, uint64(1) << 30)));

	errors	err = dec.Decode(dict, file, unpack_size, eos, false);
	if (err == OK && eos && unpack_size != UNKNOWN_SIZE && dict.pos() != unpack_size)
		err = ERROR_DATA;

	out.swap(dict.buffer);
	return err;
}

//-----------------------------------------------------------------------------
// MatchFinder
//-----------------------------------------------------------------------------

void MatchFinder::Reset() {
	window.clear();
	head.fill(0);
	chain.clear();
	pos	= 0;
}

void MatchFinder::Feed(const_memory_block b) {
	window.append(b.begin(), b.length());
	chain.resize(window.pos());
}

void MatchFinder::Hash(uint32 &h2, uint32 &h3, uint32 &h4) const {
	// Knuth multiplicative hash; the low bits of the product only depend on the low bytes
	uint32	h	= load_packed<uint32>(cur()) * 2654435761u;
	h2	= (h << 16) >> (32 - HASH_BITS2);
	h3	= ((h << 8) >> (32 - HASH_BITS3)) + (1 << HASH_BITS2);
	h4	= (h >> (32 - HASH_BITS4)) + (1 << HASH_BITS2) + (1 << HASH_BITS3);
}

uint32 MatchFinder::GetMatches(Match *matches) {
	uint32	n	= avail();
	if (n < HASH_BYTES) {
		if (n)
			++pos;
		return 0;
	}

	const uint8	*p		= cur();
	const uint8	*end	= p + min(n, uint32(State::LenMax));
	uint32		limit	= dict_size();
	Match		*out	= matches;
	uint32		maxlen	= 1;
	uint32		h2, h3, h4;

	Hash(h2, h3, h4);

	uint32	d2 = exchange(head[h2], pos + 1);
	if (d2 && pos - (d2 - 1) <= limit) {
		uint32	len = match_len(p, window.data(d2 - 1), end);
		if (len > maxlen) {
			out->len	= maxlen = len;
			out->dist	= pos - d2;
			++out;
		}
	}

	uint32	d3 = exchange(head[h3], pos + 1);
	if (d3 && d3 != d2 && pos - (d3 - 1) <= limit) {
		uint32	len = match_len(p, window.data(d3 - 1), end);
		if (len > maxlen) {
			out->len	= maxlen = len;
			out->dist	= pos - d3;
			++out;
		}
	}

	uint32	d	= head[h4];
	chain[pos]	= d;
	head[h4]	= pos + 1;

	for (uint32 hops = chain_len; d && hops-- && maxlen < nice_len; d = chain[d - 1]) {
		if (pos - (d - 1) > limit)
			break;
		uint32	len = match_len(p, window.data(d - 1), end);
		if (len > maxlen) {
			out->len	= maxlen = len;
			out->dist	= pos - d;
			++out;
		}
	}

	++pos;
	return uint32(out - matches);
}

void MatchFinder::Skip(uint32 n) {
	while (n--) {
		if (avail() >= HASH_BYTES) {
			uint32	h2, h3, h4;
			Hash(h2, h3, h4);
			head[h2]	= pos + 1;
			head[h3]	= pos + 1;
			chain[pos]	= exchange(head[h4], pos + 1);
		}
		++pos;
	}
}

dynamic_array<MatchFinder::Match> MatchFinder::FindMatches() {
	Match	found[State::LenMax + 2];
	uint32	n = GetMatches(found);

	dynamic_array<Match>	result;
	while (n--)
		result.push_back(found[n]);
	return result;
}

//-----------------------------------------------------------------------------
// LZMA Encoder
//-----------------------------------------------------------------------------

const PriceTable	Encoder::bit_prices;


Encoder::EncProps Encoder::EncProps::Preset(int level) {
	static const struct {
		uint32	dict_size;
		uint16	nice_len, chain_len;
		bool	fast;
	} presets[] = {
		{1 << 16,	32,		32,		true},
		{1 << 16,	48,		32,		true},
		{1 << 20,	64,		32,		true},
		{1 << 20,	64,		32,		true},
		{4 << 20,	32,		32,		false},
		{4 << 20,	32,		64,		false},
		{8 << 20,	64,		64,		false},
		{8 << 20,	64,		128,	false},
		{16 << 20,	128,	128,	false},
		{16 << 20,	273,	273,	false},
	};
	auto	&p = presets[min(max(level, 0), 9)];
	return EncProps(p.dict_size, p.nice_len, p.chain_len, p.fast);
}

errors Encoder::EncProps::Validate(bool lzma2) const {
	if (!valid(lzma2)) {
		LZK_TRACEF("lzma: bad lc/lp/pb %d/%d/%d\n", lc, lp, pb);
		return ERROR_PARAM;
	}
	if (dict_size < DictMin || nice_len < 5 || nice_len > LenMax || chain_len == 0) {
		LZK_TRACEF("lzma: bad dict_size/nice_len/chain_len %u/%u/%u\n", dict_size, nice_len, chain_len);
		return ERROR_PARAM;
	}
	return OK;
}


//-----------------------------------------------------------------------------
// prices
//-----------------------------------------------------------------------------

void Encoder::FillLengthPrices(uint32 prices[PosStatesMax][LenSymbolsTotal], const prob_t *lc) {
	uint32	low		= bit_prices.price0(lc[LenLow]);
	uint32	mid		= bit_prices.price1(lc[LenLow]) + bit_prices.price0(lc[LenMid]);
	uint32	high	= bit_prices.price1(lc[LenLow]) + bit_prices.price1(lc[LenMid]);
	uint32	high_prices[LenHighSymbols];

	bit_prices.fill_tree(high_prices, lc + LenHigh, LenHighBits);

	for (uint32 ps = 0, n = 1 << props.pb; ps < n; ps++) {
		uint32	*out	= prices[ps];
		uint32	tree	= ps << (1 + LenLowBits);
		bit_prices.fill_tree(out, lc + LenLow + tree, LenLowBits);
		bit_prices.fill_tree(out + LenLowSymbols, lc + LenMid + tree, LenLowBits);
		for (uint32 i = 0; i < LenLowSymbols; i++) {
			out[i]					+= low;
			out[i + LenLowSymbols]	+= mid;
		}
		for (uint32 i = 0; i < LenHighSymbols; i++)
			out[LenLowSymbols * 2 + i] = high + high_prices[i];
	}
}

void Encoder::FillDistancePrices() {
	const prob_t	*probs = this->probs();
	uint32			footer_prices[NumFullDistances];

	for (uint32 i = StartPosModelIndex; i < NumFullDistances; i++) {
		uint32	slot	= GetPosSlot(i);
		uint32	footer	= (slot >> 1) - 1;
		uint32	base	= (2 | (slot & 1)) << footer;
		footer_prices[i] = bit_prices.tree_reverse(probs + SpecPos + base, footer, i - base);
	}

	for (uint32 lps = 0; lps < LenToPosStates; lps++) {
		uint32	*slots	= pos_slot_prices[lps];
		bit_prices.fill_tree(slots, probs + PosSlot + (lps << PosSlotBits), PosSlotBits);

		// bits between the slot and the align bits are sent flat
		for (uint32 slot = EndPosModelIndex; slot < (1 << PosSlotBits); slot++)
			slots[slot] += ((slot >> 1) - 1 - AlignBits) * PriceTable::BIT;

		uint32	*dp = dist_prices[lps];
		for (uint32 i = 0; i < StartPosModelIndex; i++)
			dp[i] = slots[i];
		for (uint32 i = StartPosModelIndex; i < NumFullDistances; i++)
			dp[i] = slots[GetPosSlot(i)] + footer_prices[i];
	}

	for (uint32 i = 0; i < (1 << AlignBits); i++)
		align_prices[i] = bit_prices.tree_reverse(probs + PosAlign, AlignBits, i);
}

void Encoder::RefreshPrices() {
	if (len_count >= PRICE_REFRESH) {
		len_count = 0;
		FillDistancePrices();
		FillLengthPrices(len_prices, probs() + LenCoder);
	}
	if (replen_count >= PRICE_REFRESH) {
		replen_count = 0;
		FillLengthPrices(replen_prices, probs() + RepLenCoder);
	}
}

uint32 Encoder::LiteralPrice(uint32 at, uint32 state, const uint8 *data, uint32 rep0) const {
	const prob_t	*p = probs() + Literal + LiteralHelper(props)(at, data[-1]);
	return IsLitState(state)
		? bit_prices.tree(p, 8, data[0])
		: bit_prices.literal_matched(p, data[0], data[-int(rep0)]);
}

uint32 Encoder::RepPrice(uint32 rep, uint32 state, uint32 ps) const {
	const prob_t	*probs = this->probs();
	if (rep == 0)
		return bit_prices.price0(probs[IsRepGT0 + state]) + bit_prices.price1(probs[IsRep0Long + PosState(state, ps)]);

	uint32	price = bit_prices.price1(probs[IsRepGT0 + state]);
	if (rep == 1)
		return price + bit_prices.price0(probs[IsRepGT1 + state]);
	return price + bit_prices.price1(probs[IsRepGT1 + state]) + bit_prices.price(probs[IsRepGT2 + state], rep == 3);
}

// dist is distance - 1
uint32 Encoder::DistPrice(uint32 dist, uint32 len) const {
	uint32	lps = GetLenToPosState(len);
	return dist < NumFullDistances
		? dist_prices[lps][dist]
		: pos_slot_prices[lps][GetPosSlot(dist)] + align_prices[dist & bits(AlignBits)];
}

//-----------------------------------------------------------------------------
// parsing
//-----------------------------------------------------------------------------

// length of the repeat at dist, up to limit; 0 if the first two bytes differ
static uint32 rep_len(const uint8 *p, uint32 dist, uint32 limit) {
	const uint8	*r = p - dist;
	if (p[0] != r[0] || p[1] != r[1])
		return 0;
	return limit <= 2 ? 2 : 2 + match_len(p + 2, r + 2, p + limit);
}

// true when dist is a much shorter distance than other
static inline bool much_closer(uint32 dist, uint32 other) {
	return (other >> 7) > dist;
}

void Encoder::Apply(uint32 &state, uint32 *reps, uint32 back, uint32 len) {
	if (back == LITERAL) {
		state = NextLitState(state);

	} else if (back >= NUM_REPS) {
		reps[3]	= reps[2];
		reps[2]	= reps[1];
		reps[1]	= reps[0];
		reps[0]	= back - NUM_REPS + 1;
		state	= NextMatchState(state);

	} else if (len == 1) {
		state	= NextShortRepState(state);

	} else {
		uint32	dist = reps[back];
		for (uint32 i = back; i; --i)
			reps[i] = reps[i - 1];
		reps[0]	= dist;
		state	= NextRepState(state);
	}
}

// works out state and reps at node i from the node its cheapest arrival started at
void Encoder::Arrive(uint32 i) {
	Node		&node	= nodes[i];
	const Node	&from	= nodes[i - node.len - node.lead];

	node.state = from.state;
	for (int r = 0; r < NUM_REPS; r++)
		node.reps[r] = from.reps[r];

	if (node.lead) {
		if (node.lead > 1)
			Apply(node.state, node.reps, node.lead_back, node.lead - 1);
		Apply(node.state, node.reps, LITERAL, 1);
	}
	Apply(node.state, node.reps, node.back, node.len);
}

uint32 Encoder::Parse(uint32 at, uint32 &back) {
	RefreshPrices();

	const prob_t	*probs	= this->probs();
	uint32			pb_mask	= props.pb_mask();
	uint32			nice	= props.nice_len;
	LiteralHelper	lit(props);

	uint32	found		= lookahead ? num_found : ReadMatches();
	uint32	main_len	= found ? matches[found - 1].len : 0;
	uint32	avail		= min(avail_at(at), uint32(LenMax));

	back = LITERAL;
	if (avail < 2)
		return 1;

	const uint8	*data = match_finder.window.data(at);
	uint32		rep_lens[NUM_REPS], best_rep = 0;
	for (uint32 i = 0; i < NUM_REPS; i++) {
		rep_lens[i] = rep_len(data, reps[i], avail);
		if (rep_lens[i] > rep_lens[best_rep])
			best_rep = i;
	}

	// long enough to take without looking any further
	if (rep_lens[best_rep] >= nice) {
		back = best_rep;
		Skip(rep_lens[best_rep] - 1);
		return rep_lens[best_rep];
	}
	if (main_len >= nice) {
		back = matches[found - 1].dist + NUM_REPS;
		Skip(main_len - 1);
		return main_len;
	}

	uint8	cur_byte	= data[0];
	uint8	match_byte	= data[-int(reps[0])];
	uint32	last		= max(rep_lens[best_rep], main_len);

	if (last < 2 && cur_byte != match_byte)
		return 1;

	Node	&start = nodes[0];
	start.price	= 0;
	start.state	= state;
	for (int i = 0; i < NUM_REPS; i++)
		start.reps[i] = reps[i];

	uint32	ps			= at & pb_mask;
	prob_t	is_match	= probs[IsMatch + PosState(state, ps)];
	uint32	match_price	= bit_prices.price1(is_match);
	uint32	rep_price	= match_price + bit_prices.price1(probs[IsRep + state]);

	nodes[1].Improve(bit_prices.price0(is_match) + LiteralPrice(at, state, data, reps[0]), 1, LITERAL);

	if (match_byte == cur_byte && rep_lens[0] == 0)
		nodes[1].Improve(rep_price + ShortRepPrice(state, ps), 1, 0);

	if (last < 2) {
		back = nodes[1].back;
		nodes[1].Clear();
		return 1;
	}

	for (uint32 i = 0; i < NUM_REPS; i++) {
		if (rep_lens[i] >= 2) {
			uint32	price = rep_price + RepPrice(i, state, ps);
			for (uint32 len = rep_lens[i]; len >= 2; --len)
				nodes[len].Improve(price + replen_prices[ps][len - LenMin], len, i);
		}
	}

	if (main_len > rep_lens[0]) {
		uint32	normal	= match_price + bit_prices.price0(probs[IsRep + state]);
		uint32	m		= 0;
		for (uint32 len = max(rep_lens[0] + 1, uint32(LenMin)); len <= main_len; len++) {
			while (matches[m].len < len)
				++m;
			uint32	dist = matches[m].dist;
			nodes[len].Improve(normal + len_prices[ps][len - LenMin] + DistPrice(dist, len), len, dist + NUM_REPS);
		}
	}

	uint32	cur = 0;
	while (++cur < last) {
		found = ReadMatches();
		uint32	new_len	= found ? matches[found - 1].len : 0;
		Node	&node	= nodes[cur];

		// nothing ends here; the position is covered by a longer step
		if (node.price >= INFINITE)
			continue;

		if (new_len >= nice)
			break;

		Arrive(cur);

		uint32			pos		= at + cur;
		uint32			ps		= pos & pb_mask;
		uint32			st		= node.state;
		const uint32	*r		= node.reps;
		const uint8		*data	= match_finder.window.data(pos);
		uint8			cur_byte	= data[0];
		uint8			match_byte	= data[-int(r[0])];

		prob_t	is_match	= probs[IsMatch + PosState(st, ps)];
		uint32	match_price	= node.price + bit_prices.price1(is_match);
		uint32	lit_price	= node.price + bit_prices.price0(is_match);
		Node	&next		= nodes[cur + 1];
		bool	try_lit		= !(next.price < INFINITE && match_byte == cur_byte) && lit_price <= next.price;
		bool	next_is_lit	= false;

		if (try_lit) {
			lit_price	+= LiteralPrice(pos, st, data, r[0]);
			next_is_lit	= next.Improve(lit_price, 1, LITERAL);
		}

		uint32	rep_price	= match_price + bit_prices.price1(probs[IsRep + st]);
		uint32	avail_full	= min(min(avail_at(pos), uint32(LenMax)), uint32(OPT_SIZE - 1) - cur);

		if (match_byte == cur_byte && rep_price < next.price && (next.len < 2 || next.back != 0)) {
			if (next.Improve(rep_price + ShortRepPrice(st, ps), 1, 0))
				next_is_lit = false;
		}

		if (avail_full < 2)
			continue;

		// literal then rep 0
		if (try_lit && !next_is_lit && match_byte != cur_byte && avail_full > 2) {
			uint32	len = rep_len(data + 1, r[0], min(nice + 1, avail_full) - 1);
			if (len >= 2) {
				uint32	ps2		= (pos + 1) & pb_mask;
				uint32	price	= lit_price + Rep0Price(NextLitState(st), ps2) + replen_prices[ps2][len - LenMin];
				last = max(last, cur + 1 + len);
				nodes[cur + 1 + len].Improve(price, len, 0, 1);
			}
		}

		uint32	avail_cur	= min(avail_full, nice);
		uint32	start_len	= 2;

		for (uint32 i = 0; i < NUM_REPS; i++) {
			uint32	len = rep_len(data, r[i], avail_cur);
			if (len < 2)
				continue;

			if (i == 0)
				start_len = len + 1;

			last = max(last, cur + len);
			uint32	price = rep_price + RepPrice(i, st, ps);
			for (uint32 l = len; l >= 2; --l)
				nodes[cur + l].Improve(price + replen_prices[ps][l - LenMin], l, i);

			// rep, literal, then rep 0 at the same distance
			uint32	limit = min(len + 1 + nice, avail_full);
			if (len + 3 <= limit) {
				uint32	len2 = rep_len(data + len + 1, r[i], limit - len - 1);
				if (len2 >= 2) {
					uint32	pos1	= pos + len;
					uint32	ps1		= pos1 & pb_mask;
					uint32	ps2		= (pos1 + 1) & pb_mask;
					uint32	total	= price + replen_prices[ps][len - LenMin]
						+ bit_prices.price0(probs[IsMatch + PosState(NextRepState(st), ps1)])
						+ bit_prices.literal_matched(probs + Literal + lit(pos1, data[len - 1]), data[len], data[int(len) - int(r[i])])
						+ Rep0Price(REP_LIT, ps2) + replen_prices[ps2][len2 - LenMin];
					uint32	end		= cur + len + 1 + len2;
					last = max(last, end);
					nodes[end].Improve(total, len2, 0, len + 1, i);
				}
			}
		}

		// matches past what the reps already cover
		uint32	n = found;
		if (new_len > avail_cur) {
			new_len = avail_cur;
			for (n = 0; matches[n].len < new_len; n++)
				;
			matches[n++].len = new_len;
		}

		if (new_len >= start_len) {
			uint32	normal	= match_price + bit_prices.price0(probs[IsRep + st]);
			uint32	m		= 0;
			last = max(last, cur + new_len);

			while (matches[m].len < start_len)
				++m;

			for (uint32 len = start_len; ; len++) {
				uint32	dist	= matches[m].dist;
				uint32	price	= normal + len_prices[ps][len - LenMin] + DistPrice(dist, len);
				nodes[cur + len].Improve(price, len, dist + NUM_REPS);

				if (len == matches[m].len) {
					// match, literal, then rep 0 at the match distance
					uint32	limit = min(len + 1 + nice, avail_full);
					if (len + 3 <= limit) {
						uint32	len2 = rep_len(data + len + 1, dist + 1, limit - len - 1);
						if (len2 >= 2) {
							uint32	pos1	= pos + len;
							uint32	ps1		= pos1 & pb_mask;
							uint32	ps2		= (pos1 + 1) & pb_mask;
							uint32	total	= price
								+ bit_prices.price0(probs[IsMatch + PosState(NextMatchState(st), ps1)])
								+ bit_prices.literal_matched(probs + Literal + lit(pos1, data[len - 1]), data[len], data[int(len) - int(dist) - 1])
								+ Rep0Price(MATCH_LIT, ps2) + replen_prices[ps2][len2 - LenMin];
							uint32	end		= cur + len + 1 + len2;
							last = max(last, end);
							nodes[end].Improve(total, len2, 0, len + 1, dist + NUM_REPS);
						}
					}
					if (++m == n)
						break;
				}
			}
		}
	}

	// walk back from cur, filling path from its end
	uint32	k = OPT_SIZE;
	for (uint32 i = cur; i; ) {
		const Node	&node = nodes[i];
		path[--k] = {node.len, node.back};
		if (node.lead) {
			path[--k] = {1, LITERAL};
			if (node.lead > 1)
				path[--k] = {node.lead - 1, node.lead_back};
		}
		i -= node.len + node.lead;
	}

	for (uint32 i = 1; i <= last; i++)
		nodes[i].Clear();

	back		= path[k].back;
	path_pos	= k + 1;
	path_end	= OPT_SIZE;
	return path[k].len;
}

uint32 Encoder::ParseFast(uint32 &back) {
	uint32	at			= uint32(position);
	uint32	found		= lookahead ? num_found : ReadMatches();
	uint32	main_len	= found ? matches[found - 1].len : 0;
	uint32	avail		= min(avail_at(at), uint32(LenMax));

	back = LITERAL;
	if (avail < 2)
		return 1;

	const uint8	*data	= match_finder.window.data(at);
	uint32		rep		= 0, best_rep_len = 0;

	for (uint32 i = 0; i < NUM_REPS; i++) {
		uint32	len = rep_len(data, reps[i], avail);
		if (len >= props.nice_len) {
			back = i;
			Skip(len - 1);
			return len;
		}
		if (len > best_rep_len) {
			rep				= i;
			best_rep_len	= len;
		}
	}

	if (main_len >= props.nice_len) {
		back = matches[found - 1].dist + NUM_REPS;
		Skip(main_len - 1);
		return main_len;
	}

	uint32	main_dist = 0;
	if (main_len >= 2) {
		// a match one shorter at a much smaller distance is usually cheaper
		main_dist = matches[found - 1].dist;
		while (found > 1 && main_len == matches[found - 2].len + 1 && much_closer(matches[found - 2].dist, main_dist)) {
			--found;
			--main_len;
			main_dist = matches[found - 1].dist;
		}
		if (main_len == 2 && main_dist >= 0x80)
			main_len = 1;
	}

	if (best_rep_len >= 2 && (
			best_rep_len + 1 >= main_len
		||	(best_rep_len + 2 >= main_len && main_dist >= (1 << 9))
		||	(best_rep_len + 3 >= main_len && main_dist >= (1 << 15))
	)) {
		back = rep;
		Skip(best_rep_len - 1);
		return best_rep_len;
	}

	if (main_len < 2 || avail <= 2)
		return 1;

	// look one byte ahead; a better match there means a literal now
	found = ReadMatches();
	if (found) {
		uint32	next_len	= matches[found - 1].len;
		uint32	next_dist	= matches[found - 1].dist;
		if (next_len >= 2 && (
				(next_len >= main_len && next_dist < main_dist)
			||	(next_len == main_len + 1 && !much_closer(main_dist, next_dist))
			||	next_len > main_len + 1
			||	(next_len + 1 >= main_len && main_len >= 3 && much_closer(next_dist, main_dist))
		))
			return 1;
	}

	data = match_finder.window.data(at + 1);
	for (uint32 i = 0; i < NUM_REPS; i++) {
		if (rep_len(data, reps[i], main_len - 1) >= main_len - 1)
			return 1;
	}

	back = main_dist + NUM_REPS;
	Skip(main_len - 2);
	return main_len;
}

uint32 Encoder::NextStep(uint32 &back) {
	if (path_pos < path_end) {
		back = path[path_pos].back;
		return path[path_pos++].len;
	}
	return props.fast ? ParseFast(back) : Parse(uint32(position), back);
}

//-----------------------------------------------------------------------------
// coding
//-----------------------------------------------------------------------------

void Encoder::EncodeLength(encoder &rc, prob_t *lc, uint32 sym, uint32 ps) {
	uint32	tree = ps << (1 + LenLowBits);
	rc.bit(lc[LenLow], sym >= LenLowSymbols);
	if (sym < LenLowSymbols) {
		rc.tree(lc + LenLow + tree, LenLowBits, sym);
		return;
	}
	sym -= LenLowSymbols;
	rc.bit(lc[LenMid], sym >= LenLowSymbols);
	if (sym < LenLowSymbols)
		rc.tree(lc + LenMid + tree, LenLowBits, sym);
	else
		rc.tree(lc + LenHigh, LenHighBits, sym - LenLowSymbols);
}

// dist is distance - 1
void Encoder::EncodeDistance(encoder &rc, prob_t *probs, uint32 dist, uint32 lps) {
	uint32	slot = GetPosSlot(dist);
	rc.tree(probs + PosSlot + (lps << PosSlotBits), PosSlotBits, slot);
	if (slot < StartPosModelIndex)
		return;

	uint32	footer	= (slot >> 1) - 1;
	uint32	base	= (2 | (slot & 1)) << footer;
	uint32	rest	= dist - base;
	if (slot < EndPosModelIndex) {
		rc.tree_reverse(probs + SpecPos + base, footer, rest);
	} else {
		rc.direct(rest >> AlignBits, footer - AlignBits);
		rc.tree_reverse(probs + PosAlign, AlignBits, rest & bits(AlignBits));
	}
}

void Encoder::EncodeLiteral(encoder &rc) {
	uint32		at		= uint32(position);
	const uint8	*data	= match_finder.window.data(at);
	prob_t		*probs	= this->probs();

	rc.bit(probs[IsMatch + PosState(state, at & props.pb_mask())], false);

	prob_t	*p = probs + Literal + (at ? LiteralHelper(props)(at, data[-1]) : 0);
	if (IsLitState(state))
		rc.tree(p, 8, data[0]);
	else
		rc.literal_matched(p, data[0], data[-int(reps[0])]);
	state = NextLitState(state);
}

void Encoder::EncodeMatch(encoder &rc, uint32 dist, uint32 len, uint32 ps) {
	prob_t	*probs = this->probs();
	rc.bit(probs[IsMatch + PosState(state, ps)], true);
	rc.bit(probs[IsRep + state], false);
	EncodeLength(rc, probs + LenCoder, len - LenMin, ps);
	EncodeDistance(rc, probs, dist, GetLenToPosState(len));
	++len_count;

	reps[3]	= reps[2];
	reps[2]	= reps[1];
	reps[1]	= reps[0];
	reps[0]	= dist + 1;
	state	= NextMatchState(state);
}

void Encoder::EncodeRep(encoder &rc, uint32 rep, uint32 len, uint32 ps) {
	prob_t	*probs = this->probs();
	rc.bit(probs[IsMatch + PosState(state, ps)], true);
	rc.bit(probs[IsRep + state], true);
	rc.bit(probs[IsRepGT0 + state], rep != 0);

	if (rep == 0) {
		rc.bit(probs[IsRep0Long + PosState(state, ps)], len != 1);
		if (len == 1) {
			state = NextShortRepState(state);
			return;
		}
	} else {
		rc.bit(probs[IsRepGT1 + state], rep != 1);
		if (rep != 1)
			rc.bit(probs[IsRepGT2 + state], rep != 2);
		uint32	dist = reps[rep];
		for (uint32 i = rep; i; --i)
			reps[i] = reps[i - 1];
		reps[0] = dist;
	}

	EncodeLength(rc, probs + RepLenCoder, len - LenMin, ps);
	++replen_count;
	state = NextRepState(state);
}

void Encoder::WriteEndMarker(encoder &rc) {
	EncodeMatch(rc, 0xFFFFFFFF, LenMin, uint32(position) & props.pb_mask());
}

void Encoder::WriteProperties(uint8 header[5]) const {
	header[0] = props.encode();
	store_le<uint32>(header + 1, props.dict_size);
}

void Encoder::CodeOneBlock(encoder &rc, uint32 maxPackSize, uint32 maxUnpackSize) {
	uint64	start = position;

	if (position == 0 && remaining()) {
		// nothing to match against yet
		EncodeLiteral(rc);
		match_finder.Skip(1);
		++position;
	}

	for (;;) {
		if (lookahead == 0) {
			uint64	done = position - start;
			if (!remaining() || (maxPackSize
				? done + OPT_SIZE + 300 >= maxUnpackSize || rc.tell() + OPT_SIZE * 8 >= maxPackSize
				: done >= 1 << 17
			))
				return;
		}

		uint32	back, len = NextStep(back);
		uint32	ps = uint32(position) & props.pb_mask();

		if (back == LITERAL)
			EncodeLiteral(rc);
		else if (back < NUM_REPS)
			EncodeRep(rc, back, len, ps);
		else
			EncodeMatch(rc, back - NUM_REPS, len, ps);

		position	+= len;
		lookahead	-= len;
	}
}

void Encoder::Init() {
	State::Reset();
	lookahead	= 0;
	num_found	= 0;
	path_pos	= path_end = 0;
	for (auto &i : nodes)
		i.Clear();
}

void Encoder::Reset() {
	match_finder.Reset();
	position = 0;
	Init();
	InitPrices();
}

errors Encoder::Encode(dynamic_array<uint8> &out, const_memory_block src) {
	if (errors e = props.Validate(false))
		return e;

	Reset();
	Feed(src);

	byte_writer	w(out);
	encoder		rc(w);

	do
		CodeOneBlock(rc, 0, 0);
	while (remaining());

	if (props.eos)
		WriteEndMarker(rc);
	rc.flush();
	return OK;
}

errors lzma::encode(dynamic_array<uint8> &out, const_memory_block src, const Encoder::EncProps &props) {
	if (errors e = props.Validate(false))
		return e;
	Encoder	enc(props);
	return enc.Encode(out, src);
}
