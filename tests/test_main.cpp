// the only translation unit that provides doctest's implementation and main()
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
