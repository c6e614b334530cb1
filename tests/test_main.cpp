/**
 * @file test_main.cpp
 * @brief Точка входа тестов (doctest)
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
