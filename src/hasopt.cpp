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

#include "hasopt.hpp"
#include <string.h>
#include <stdlib.h>
#include <ctype.h>
#include <exception>
#include <iostream>



namespace gf25519 {   namespace GF25519_SONAME {

static
void remove_arg(int *argc, char **argv, int i)
{
	for (int j = i + 1; j < *argc; ++j) {
		argv[j - 1] = argv[j];
	}
	--*argc;
}


int hasopt(int *argcp, char **argv, const char *opts, const char **val)
{
	for (int i = 1; i < *argcp; ++i) {
		if (argv[i][0] != '-' || argv[i][1] == '-' || argv[i][1] == 0) continue;
		char *cp = argv[i] + 1;
		const char *op = strchr(opts, *cp);
		if (op == 0 || *op == ':') {
			return -1;
		}
		if (op[1] == ':') {
			if (cp[1]) {
				// -nVALUE
				*val = cp + 1;
				remove_arg(argcp, argv, i);
			} else if (i + 1 < *argcp) {
				// -n VALUE
				*val = argv[i + 1];
				remove_arg(argcp, argv, i + 1);
				remove_arg(argcp, argv, i);
			} else {
				return -1;
			}
			return *op;
		}
		// Flags may be grouped as in -vx. Take out the first one.
		memmove(cp, cp + 1, strlen(cp));
		if (*cp == 0) {
			remove_arg(argcp, argv, i);
		}
		return *op;
	}
	return 0;
}


bool hasopt_long (int *argc, char **argv, const char *longopt)
{
	for (int i = 1; i < *argc; ++i) {
		if (strcmp(argv[i], longopt) == 0) {
			remove_arg(argc, argv, i);
			return true;
		}
	}
	return false;
}



std::string describe(const std::exception &e)
{
	std::string res("Reason: ");
	res += e.what();
	res += '\n';

	try {
		std::rethrow_if_nested(e);
	} catch (std::exception &ne) {
		res += describe(ne);
	} catch (...) {
		res += "Unknown exception class\n";
	}
	return res;
}


static void show_exception(const std::exception &e)
{
	std::cerr << _("The program was interrupted\n") << describe(e);
}


int run_main(int (*real_main)())
{
	try {
		return real_main();
	} catch (std::exception &e) {
		show_exception(e);
		return EXIT_FAILURE;
	} catch (...) {
		std::cerr << _("Some unknown exception was caught.\n");
		return EXIT_FAILURE;
	}
}


int run_main(int argc, char **argv, int (*real_main)(int,char**))
{
	try {
		return real_main(argc, argv);
	} catch (std::exception &e) {
		show_exception(e);
		return EXIT_FAILURE;
	} catch (...) {
		std::cerr << _("Some unknown exception was caught.\n");
		return EXIT_FAILURE;
	}
}


void process_format_stream (std::ostream &os, const char **fmt, int *argnum)
{
	const char *sow = *fmt;
	const char *eow = sow;

	// Literal text, with %% collapsed.
	for (;;) {
		while (*eow && *eow != '%') ++eow;
		os.write (sow, eow - sow);
		if (eow[0] == '%' && eow[1] == '%') {
			os << '%';
			eow += 2;
			sow = eow;
		} else {
			break;
		}
	}

	if (*eow == 0) {
		*fmt = eow;
		*argnum = 0;
		return;
	}

	++eow;
	if (isdigit((unsigned char)*eow)) {
		char *endstr;
		long val = strtol (eow, &endstr, 10);
		if (*endstr == '%') {
			// %n% uses the default formatting.
			*argnum = int(val);
			*fmt = endstr + 1;
			return;
		} else if (*endstr == '$') {
			*argnum = int(val);
			eow = endstr + 1;
		} else {
			++*argnum;
		}
	} else {
		++*argnum;
	}

	std::ios_base::fmtflags how = os.flags() & ~(
			std::ios_base::adjustfield | std::ios_base::basefield |
			std::ios_base::floatfield | std::ios_base::showbase |
			std::ios_base::showpos | std::ios_base::uppercase |
			std::ios_base::boolalpha);
	how |= std::ios_base::right;

	for (;; ++eow) {
		if (*eow == '-') {
			how = (how & ~std::ios_base::adjustfield) | std::ios_base::left;
		} else if (*eow == '#') {
			how |= std::ios_base::showbase;
		} else if (*eow == '+') {
			how |= std::ios_base::showpos;
		} else {
			break;
		}
	}

	os.fill (' ');
	if (*eow == '0') {
		os.fill ('0');
		++eow;
	}

	if (isdigit((unsigned char)*eow)) {
		os.width (strtol (eow, 0, 10));
		while (isdigit((unsigned char)*eow)) ++eow;
	}

	if (*eow == '.') {
		++eow;
		os.precision (strtol (eow, 0, 10));
		while (isdigit((unsigned char)*eow)) ++eow;
	}

	// Size modifiers do not matter for streams.
	while (*eow && strchr("hljztL", *eow)) ++eow;

	switch (*eow) {
	case 'o':  how |= std::ios_base::oct;  break;
	case 'X':  how |= std::ios_base::uppercase;  // fall through
	case 'x':  how |= std::ios_base::hex;  break;
	case 'E':  how |= std::ios_base::uppercase;  // fall through
	case 'e':  how |= std::ios_base::scientific;  break;
	case 'F':  how |= std::ios_base::uppercase;  // fall through
	case 'f':  how |= std::ios_base::fixed;  break;
	case 'd':
	case 'u':  how |= std::ios_base::dec;  break;
	case 's':  how |= std::ios_base::boolalpha | std::ios_base::dec;  break;
	case 0:
		throw std::runtime_error ("Incomplete format specification");
	default:
		how |= std::ios_base::dec;
	}
	os.flags (how);

	*fmt = eow + 1;
}


}}
