//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Entry point for the LeaseCat unit tests.
// All test cases are linked into a single executable.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
