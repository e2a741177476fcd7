#include "defs.h"
#include <stdio.h>

namespace lzk {

static void __lzk_debug_print(void*, const char *s) {
	fputs(s, stderr);
}

static uint32	assert_count;

_lzk_debug_print_t _lzk_debug_print = {&__lzk_debug_print, 0};

_lzk_debug_print_t _lzk_set_debug_print(const _lzk_debug_print_t &f) {
	return exchange(_lzk_debug_print, f);
}

void _lzk_assert_msg(const char *filename, int line, const char *expr) {
	++assert_count;
	_lzk_debug_print(format_string("%s(%d): %s\n", filename, line, expr));
}

uint32 _lzk_assert_count() {
	return assert_count;
}

format_string::format_string(const char *fmt, ...) {
	va_list	args;
	va_start(args, fmt);
	vsnprintf(buffer, sizeof(buffer), fmt, args);
	va_end(args);
}

//-----------------------------------------------------------------------------
//	trace_accum
//-----------------------------------------------------------------------------

trace_accum::trace_accum(const char *fmt, ...) {
	va_list	args;
	va_start(args, fmt);
	int	n = vsnprintf(buffer, sizeof(buffer), fmt, args);
	va_end(args);
	len	= n < 0 ? 0 : min(size_t(n), sizeof(buffer) - 1);
}

trace_accum::~trace_accum() {
	if (len)
		_lzk_debug_print(buffer);
}

void trace_accum::append(const char *s) {
	size_t	n = min(strlen(s), sizeof(buffer) - 1 - len);
	memcpy(buffer + len, s, n);
	len += n;
	buffer[len] = 0;
}

trace_accum& trace_accum::operator<<(int64 i) {
	char	s[24];
	snprintf(s, sizeof(s), "%lld", (long long)i);
	append(s);
	return *this;
}

trace_accum& trace_accum::operator<<(uint64 i) {
	char	s[24];
	snprintf(s, sizeof(s), "%llu", (unsigned long long)i);
	append(s);
	return *this;
}

} // namespace lzk
