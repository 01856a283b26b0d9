#pragma once

#include <gtest/gtest.h>

// Runs all tests, accepting the logging and --seed cmdline params alongside gtest's own flags.
int launch_gtest(int argc, char** argv);
