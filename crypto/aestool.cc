// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/aestool_lib.h"

int main(int argc, char** argv) { return crypto::aestool::run(argc, argv); }
