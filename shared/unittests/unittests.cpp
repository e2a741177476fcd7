#include "base/defs.h"

using namespace lzk;

// every test is a static object that runs before main; main only reports
int main(int argc, char *argv[]) {
	if (uint32 failed = _lzk_assert_count()) {
		LZK_OUTPUTF("%u assertions failed\n", failed);
		return 1;
	}
	LZK_OUTPUT("all tests passed\n");
	return 0;
}
