/*
 * Copyright (c) 2017-2019, Pelayo Bernedo.
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE
 * GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)
 * HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
 * LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT
 * OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

// Command line calculator for field elements. Mostly useful to produce and
// check test vectors.

#include "fe25519.hpp"
#include "misc.hpp"
#include "hasopt.hpp"
#include <iostream>
#include <string.h>
#include <stdlib.h>
#include <vector>

using namespace gf25519;


static void usage(std::ostream &os)
{
	os << _("usage is gfcalc [options] operation operands...\n");
	os << _("Operands are 32 byte little endian encodings written as 64 hex\n"
	        "digits. Spaces between the digits are allowed.\n\n");
	os << _("pack x                   canonical encoding of x\n");
	os << _("add x y                  x + y\n");
	os << _("sub x y                  x - y\n");
	os << _("mul x y                  x * y\n");
	os << _("sq x                     x * x\n");
	os << _("inv x                    1/x. The inverse of 0 is 0\n");
	os << _("swap x y bit             show x and y after a conditional swap\n\n");
	os << _("--strict                 reject operands with the top bit set\n");
	os << _("--raw                    show also the limbs of the result\n");
	os << _("-v                       show the decoded operands\n");
	os << _("--help                   show this help\n");
}


struct Options {
	bool strict = false;
	bool raw = false;
	bool verbose = false;
};


static void read_operand(Fe &fe, const char *hex, const Options &opt)
{
	std::vector<uint8_t> bytes;
	const char *next;
	ptrdiff_t n = read_block(hex, &next, bytes);
	if (n < 0 || *next) {
		throw_rte(_("The operand '%s' is not a sequence of hex digits."), hex);
	}
	if (bytes.size() != 32) {
		throw_rte(_("The operand '%s' has %d bytes instead of 32."), hex, bytes.size());
	}
	if (opt.strict) {
		if (unpack_checked(fe, &bytes[0]) != 0) {
			throw_rte(_("The operand '%s' has the top bit set."), hex);
		}
	} else {
		unpack(fe, &bytes[0]);
	}
	if (opt.verbose) {
		format(std::cout, _("operand %s\n"), fe);
	}
}


static void check_count(int argc, int expected, const char *op)
{
	if (argc != expected + 2) {
		throw_rte(_("The operation %s requires %d operands."), op, expected);
	}
}


static void show_result(const Fe &res, const Options &opt)
{
	std::cout << res << '\n';
	if (opt.raw) {
		show_raw(std::cout, "limbs", res);
	}
}


static int real_main(int argc, char **argv)
{
	Options opt;
	const char *val;
	int c;

	if (hasopt_long(&argc, argv, "--help")) {
		usage(std::cout);
		return 0;
	}
	if (hasopt_long(&argc, argv, "--strict")) {
		opt.strict = true;
	}
	if (hasopt_long(&argc, argv, "--raw")) {
		opt.raw = true;
	}
	while ((c = hasopt(&argc, argv, "v", &val)) != 0) {
		switch (c) {
		case 'v':
			opt.verbose = true;
			break;
		default:
			usage(std::cerr);
			return EXIT_FAILURE;
		}
	}

	if (argc < 2) {
		usage(std::cerr);
		return EXIT_FAILURE;
	}

	const char *op = argv[1];
	Fe x, y, res;

	if (strcmp(op, "pack") == 0) {
		check_count(argc, 1, op);
		read_operand(x, argv[2], opt);
		show_result(x, opt);

	} else if (strcmp(op, "add") == 0 || strcmp(op, "sub") == 0) {
		check_count(argc, 2, op);
		read_operand(x, argv[2], opt);
		read_operand(y, argv[3], opt);
		Fe_sum s;
		if (op[0] == 'a') {
			add(s, x, y);
		} else {
			sub(s, x, y);
		}
		if (opt.raw) {
			show_raw(std::cout, "sum", s);
		}
		carry(res, s);
		show_result(res, opt);

	} else if (strcmp(op, "mul") == 0) {
		check_count(argc, 2, op);
		read_operand(x, argv[2], opt);
		read_operand(y, argv[3], opt);
		mul(res, x, y);
		show_result(res, opt);

	} else if (strcmp(op, "sq") == 0) {
		check_count(argc, 1, op);
		read_operand(x, argv[2], opt);
		square(res, x);
		show_result(res, opt);

	} else if (strcmp(op, "inv") == 0) {
		check_count(argc, 1, op);
		read_operand(x, argv[2], opt);
		inverse(res, x);
		show_result(res, opt);

	} else if (strcmp(op, "swap") == 0) {
		check_count(argc, 3, op);
		read_operand(x, argv[2], opt);
		read_operand(y, argv[3], opt);
		if (strcmp(argv[4], "0") != 0 && strcmp(argv[4], "1") != 0) {
			throw_rte(_("The swap bit must be 0 or 1, not '%s'."), argv[4]);
		}
		swap(x, y, argv[4][0] - '0');
		show_result(x, opt);
		show_result(y, opt);

	} else {
		throw_rte(_("Unknown operation '%s'. Try gfcalc --help."), op);
	}

	return 0;
}


int main(int argc, char **argv)
{
	return run_main(argc, argv, real_main);
}
