//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "gtest_printer.hpp"

int main(int argc, char** const argv)
{
    return dtui::GtestPrinter::runAllTests(argc, argv, "engine_tests");
}
