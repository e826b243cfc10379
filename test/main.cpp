/* SPDX-License-Identifier: MIT */
/*
 * Netweave Test Runner
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
