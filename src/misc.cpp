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

#include "misc.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <limits.h>
#include <ctype.h>


namespace gf25519 {    namespace GF25519_SONAME {


int crypto_neq(const void *vp1, const void *vp2, size_t n)
{
	const unsigned char *v1 = (const unsigned char*)vp1;
	const unsigned char *v2 = (const unsigned char*)vp2;
	unsigned diff = 0;
	for (size_t i = 0; i < n; ++i) {
		diff |= v1[i] ^ v2[i];
	}
	// Only the lower 8 bits may be non zero. diff-1 will have the high bit
	// set if and only if diff was zero.
	diff = (diff - 1) >> (sizeof(unsigned)*CHAR_BIT - 1);
	return diff ^ 1;
}


int is_zero(const void *vp1, size_t n)
{
	const unsigned char *v1 = (const unsigned char*)vp1;
	unsigned acc = 0;
	for (size_t i = 0; i < n; ++i) {
		acc |= v1[i];
	}
	return (acc - 1) >> (sizeof(unsigned)*CHAR_BIT - 1);
}


void crypto_bzero(void *p, size_t n)
{
	volatile char *pc = (volatile char*)p;
	while (n > 0) {
		*pc++ = 0;
		--n;
	}
}


void show_block(std::ostream &os, const char *label, const void *vb, size_t nbytes, int group)
{
	const uint8_t *b = (const uint8_t*)vb;
	if (label) {
		os << label << ": ";
	}
	os << std::hex << std::setfill ('0') << std::noshowbase;
	for (size_t i = 0; i < nbytes; ++i) {
		os << std::setw(2) << unsigned(b[i]);
		if (group > 0 && int(i % group) == group - 1 && i + 1 < nbytes) {
			os << ' ';
		}
	}
	os << std::dec << std::setfill (' ') << '\n';
}


void write_block(std::string &dst, const void *vb, size_t nbytes)
{
	std::ostringstream os;
	const uint8_t *b = (const uint8_t*)vb;
	os << std::hex << std::setfill ('0') << std::noshowbase;
	for (size_t i = 0; i < nbytes; ++i) {
		os << std::setw(2) << unsigned(b[i]);
		if (i % 4 == 3 && i + 1 < nbytes) os << ' ';
	}
	dst = os.str();
}


static int hexval(char c)
{
	if ('0' <= c && c <= '9') {
		return c - '0';
	} else if ('a' <= c && c <= 'f') {
		return c - 'a' + 10;
	} else if ('A' <= c && c <= 'F') {
		return c - 'A' + 10;
	} else {
		return -1;
	}
}


ptrdiff_t read_block(const char *in, const char **next, std::vector<uint8_t> &dst)
{
	dst.clear();
	for (;;) {
		while (isspace((unsigned char)*in)) ++in;
		int hi = hexval(*in);
		if (hi == -1) {
			break;
		}
		++in;
		while (isspace((unsigned char)*in)) ++in;
		int lo = hexval(*in);
		if (lo == -1) {
			*next = in;
			return -1;
		}
		++in;
		dst.push_back(uint8_t(hi << 4 | lo));
	}
	*next = in;
	return dst.size();
}


}}
