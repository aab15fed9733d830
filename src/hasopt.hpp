#ifndef GF25519_HASOPT_HPP
#define GF25519_HASOPT_HPP

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


// Command line options, formatted output and error handling.


#include "soname.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace gf25519 {   inline  namespace GF25519_SONAME {

// Similar to getopt. The opts string is the same as the one for getopt: a
// sequence of single letter options. If the option takes an argument then it
// is followed by a colon. The function returns the option that was found. If
// the option takes an argument then *val is set to point to it. If there is
// an error then -1 is returned. It returns 0 when there are no more
// options to process. The argc and argv are modified to remove the options.
EXPORTFN int hasopt (int *argcp, char **argv, const char *opts, const char **val);


// Check if a long flag was passed in the command line and remove it from
// the arguments. The longopt must include the hyphens.
EXPORTFN bool hasopt_long (int *argc, char **argv, const char *longopt);


// Return a string which contains the error description, including any nested
// exceptions.
EXPORTFN std::string describe (const std::exception &e);


// Run the real_main. Catch and show any exceptions.
EXPORTFN int run_main (int (*real_main)());
EXPORTFN int run_main (int argc, char **argv, int (*real_main)(int,char**));


// Placeholder for internationalization.
inline const char * _(const char *s) { return s; }


// format (stream,fmt,args...) works as fprintf but outputs to a
// std::ostream using the operator<< of each argument. The conversion
// letters only set the flags of the stream: %x selects hexadecimal, %d
// decimal, %s boolalpha and so on. Width, precision, the '0' fill and the
// '-', '+' and '#' flags are honoured. Positional arguments are written
// as %1% or as %2$x. %% writes a single percent sign.

// Auxiliary function. Writes the literal text up to the next conversion,
// sets the stream flags for it and stores in *argnum the argument to use
// (0 if there is none).
EXPORTFN
void process_format_stream (std::ostream &os, const char **fmt, int *argnum);

inline void format (std::ostream &os, const char *s) {
	os << s;
}

inline void format_helper (std::ostream&, int) {}

template <class T1, class ... Args>
inline void format_helper (std::ostream &os, int n, const T1 &t1,
                           const Args &... args)
{
	if (n == 1) {
		os << t1;
	} else {
		format_helper (os, n - 1, args...);
	}
}

template <class ... Args>
void format (std::ostream &os, const char *fmt, const Args &... args)
{
	const char *sow = fmt;
	int argnum = 0;
	auto sf = os.flags();
	auto sp = os.precision();
	auto sfill = os.fill();

	while (*sow) {
		process_format_stream (os, &sow, &argnum);
		format_helper (os, argnum, args...);
		os.precision (sp);
		os.fill (sfill);
	}
	os.flags (sf);
}

// Return a string with the proper formatting.
template <class ... Args>
std::string sformat (const char *fmt, const Args &... args)
{
	std::ostringstream os;
	format (os, fmt, args...);
	return os.str();
}


// Throw a std::runtime_error exception with the given information.
template <class ...Args>
void throw_rte (const char *fmt, const Args &... args)
{
	throw std::runtime_error (sformat (fmt, args...));
}

// Throw with nested using the given information.
template <class ...Args>
void throw_nrte (const char *fmt, const Args &... args)
{
	std::throw_with_nested (std::runtime_error (sformat (fmt, args...)));
}


}}

#endif
