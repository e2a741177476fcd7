#ifndef DEFS_H
#define DEFS_H

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <stdarg.h>
#include <utility>
#include <algorithm>
#include <type_traits>

#if defined NDEBUG && !defined LZK_RELEASE
#define LZK_RELEASE
#endif

#ifdef _MSC_VER
#include <intrin.h>
#define force_inline	__forceinline
#define lzk_printf(f, a)
#else
#define force_inline	inline __attribute__((always_inline))
#define lzk_printf(f, a)	__attribute__((format(printf, f, a)))
#endif

namespace lzk {

//-----------------------------------------------------------------------------
//	types
//-----------------------------------------------------------------------------

typedef uint8_t		uint8;
typedef int8_t		int8;
typedef uint16_t	uint16;
typedef int16_t		int16;
typedef uint32_t	uint32;
typedef int32_t		int32;
typedef uint64_t	uint64;
typedef int64_t		int64;

using std::min;
using std::max;
using std::swap;
using std::exchange;
using std::move;
using std::forward;

template<typename T, size_t N> constexpr size_t	num_elements(T (&)[N])	{ return N; }
template<typename T, size_t N> constexpr T*		end(T (&a)[N])			{ return a + N; }

//-----------------------------------------------------------------------------
//	bits
//-----------------------------------------------------------------------------

constexpr uint32	bits(uint32 n)			{ return n >= 32 ? ~0u : (1u << n) - 1; }
constexpr uint64	bits64(uint32 n)		{ return n >= 64 ? ~uint64(0) : (uint64(1) << n) - 1; }

// x must be non-zero
inline uint32 highest_set_index(uint32 x) {
#ifdef _MSC_VER
	unsigned long	i;
	_BitScanReverse(&i, x);
	return i;
#else
	return 31 - __builtin_clz(x);
#endif
}

template<typename T> T load_packed(const void *p) {
	T	t;
	memcpy(&t, p, sizeof(T));
	return t;
}

template<typename T> T load_be(const uint8 *p) {
	T	t = 0;
	for (size_t i = 0; i < sizeof(T); i++)
		t = T(t << 8) | p[i];
	return t;
}
template<typename T> T load_le(const uint8 *p) {
	T	t = 0;
	for (size_t i = sizeof(T); i--;)
		t = T(t << 8) | p[i];
	return t;
}
template<typename T> void store_be(uint8 *p, T t) {
	for (size_t i = sizeof(T); i--; t >>= 8)
		p[i] = uint8(t);
}
template<typename T> void store_le(uint8 *p, T t) {
	for (size_t i = 0; i < sizeof(T); i++, t >>= 8)
		p[i] = uint8(t);
}

//-----------------------------------------------------------------------------
//	memory blocks
//-----------------------------------------------------------------------------

struct const_memory_block {
	const void	*p;
	size_t		n;

	const_memory_block() : p(0), n(0) {}
	const_memory_block(const void *p, size_t n) : p(p), n(n) {}
	const_memory_block(const void *p, const void *e) : p(p), n((const uint8*)e - (const uint8*)p) {}
	template<size_t N> const_memory_block(const char (&s)[N]) : p(s), n(N - 1) {}

	const uint8*	begin()						const	{ return (const uint8*)p; }
	const uint8*	end()						const	{ return (const uint8*)p + n; }
	size_t			length()					const	{ return n; }
	bool			empty()						const	{ return n == 0; }
	const_memory_block	slice(size_t offset)	const	{ return offset < n ? const_memory_block(begin() + offset, n - offset) : const_memory_block(end(), size_t(0)); }
	const_memory_block	slice(size_t offset, size_t len) const {
		offset = min(offset, n);
		return const_memory_block(begin() + offset, min(len, n - offset));
	}
	bool	operator==(const const_memory_block &b) const	{ return n == b.n && (n == 0 || memcmp(p, b.p, n) == 0); }
	bool	operator!=(const const_memory_block &b) const	{ return !(*this == b); }
};

struct memory_block {
	void		*p;
	size_t		n;

	memory_block() : p(0), n(0) {}
	memory_block(void *p, size_t n) : p(p), n(n) {}
	memory_block(void *p, void *e) : p(p), n((uint8*)e - (uint8*)p) {}

	uint8*		begin()		const	{ return (uint8*)p; }
	uint8*		end()		const	{ return (uint8*)p + n; }
	size_t		length()	const	{ return n; }
	operator const_memory_block() const	{ return const_memory_block(p, n); }
};

//-----------------------------------------------------------------------------
//	debug stuff
//-----------------------------------------------------------------------------

struct _lzk_debug_print_t {
	typedef void func(void*, const char*);
	func	*f;
	void	*p;
	void operator()(const char *s) const { f(p, s); }
};

extern _lzk_debug_print_t	_lzk_debug_print;
_lzk_debug_print_t			_lzk_set_debug_print(const _lzk_debug_print_t &f);
void						_lzk_assert_msg(const char *filename, int line, const char *expr);
uint32						_lzk_assert_count();

#ifdef LZK_BREAK_ON_ASSERT
#ifdef _MSC_VER
inline void _lzk_break()	{ __debugbreak(); }
#else
inline void _lzk_break()	{ __builtin_trap(); }
#endif
#else
inline void _lzk_break()	{}
#endif

struct format_string {
	char	buffer[512];
	format_string(const char *fmt, ...) lzk_printf(2, 3);
	operator const char*()	const	{ return buffer; }
};

class trace_accum {
	char	buffer[512];
	size_t	len;
	void	append(const char *s);
public:
	trace_accum() : len(0) { buffer[0] = 0; }
	trace_accum(const char *fmt, ...) lzk_printf(2, 3);
	~trace_accum();
	trace_accum&	operator<<(const char *s)	{ append(s); return *this; }
	trace_accum&	operator<<(char c)			{ char s[2] = {c, 0}; append(s); return *this; }
	trace_accum&	operator<<(int64 i);
	trace_accum&	operator<<(uint64 i);
	trace_accum&	operator<<(int i)			{ return *this << int64(i); }
	trace_accum&	operator<<(uint32 i)		{ return *this << uint64(i); }
};

struct dummy_accum {
	template<typename T> dummy_accum& operator<<(const T&) { return *this; }
};

} // namespace lzk

#define DO(x)							do x while(0)
#define LZK_OUTPUT(x)					lzk::_lzk_debug_print(x)
#define LZK_OUTPUTF(...)				lzk::trace_accum(__VA_ARGS__)
#define LZK_ALWAYS_ASSERT2(exp, msg)	DO({if (!(exp)) { lzk::_lzk_assert_msg(__FILE__, __LINE__, msg); lzk::_lzk_break(); } })
#define LZK_ALWAYS_ASSERT(exp)			LZK_ALWAYS_ASSERT2(exp, #exp)

#ifdef LZK_RELEASE
#define LZK_NOT_RELEASE(x)
#define LZK_NOT_RELEASE_STMT(x)	((void)0)
#define LZK_TRACEF(...)			lzk::dummy_accum()
#else
#define LZK_NOT_RELEASE(x)		x
#define LZK_NOT_RELEASE_STMT(x)	x
#define LZK_TRACEF(...)			lzk::trace_accum(__VA_ARGS__)
#endif

#define LZK_ASSERT(exp)			LZK_NOT_RELEASE_STMT(LZK_ALWAYS_ASSERT(exp))
#define LZK_ASSERT2(exp, msg)	LZK_NOT_RELEASE_STMT(LZK_ALWAYS_ASSERT2(exp, msg))
#define LZK_TRACE(x)			LZK_NOT_RELEASE_STMT(LZK_OUTPUT(x))

#endif // DEFS_H
