// Headless test binary for the salvo combat core.
// Suites live in one file per module; this file only provides main().

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
