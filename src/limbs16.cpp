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

#include "limbs16.hpp"
#include "misc.hpp"
#include <iostream>
#include <iomanip>
#include <string>

namespace gf25519 {  namespace GF25519_SONAME {

// p = 2²⁵⁵-19 in limbs.
static const int64_t p0 = 0xffed, pmid = 0xffff, p15 = 0x7fff;


void unpack (Limbs16 &res, const uint8_t b[32])
{
	for (int i = 0; i < limb_count; ++i) {
		res.v[i] = leget16 (b + 2*i);
	}
	res.v[15] &= 0x7fff;
}


int unpack_checked (Limbs16 &res, const uint8_t b[32])
{
	if (b[31] & 0x80) {
		return -1;
	}
	unpack (res, b);
	return 0;
}


// Subtract p from t if t >= p. Constant time.
static void subtract_p (Limbs16 &t)
{
	Limbs16 m;
	Janitor jan(&m, sizeof m);

	m.v[0] = t.v[0] - p0;
	for (int i = 1; i < limb_count - 1; ++i) {
		m.v[i] = t.v[i] - pmid - ((m.v[i - 1] >> 16) & 1);
		m.v[i - 1] &= 0xffff;
	}
	m.v[15] = t.v[15] - p15 - ((m.v[14] >> 16) & 1);
	int64_t borrow = (m.v[15] >> 16) & 1;
	m.v[14] &= 0xffff;
	// No borrow means t >= p: keep m.
	swap (t, m, 1 - borrow);
}


void pack (uint8_t b[32], const Limbs16 &a)
{
	Limbs16 t = a;
	Janitor jan(&t, sizeof t);

	carry (t);
	carry (t);
	carry (t);
	// Now the limbs are in [0, 2¹⁶). Each round maps [p, 2p) to [0, p).
	subtract_p (t);
	subtract_p (t);

	for (int i = 0; i < limb_count; ++i) {
		leput16 (b + 2*i, uint16_t(t.v[i]));
	}
}


// Bits of p-2 = 2²⁵⁵ - 21 = 0x7fff...ffeb are all 1 except bits 2 and 4.
// Starting with acc = a instead of 1 accounts for bit 254, so the loop
// starts at bit 253.
void inverse (Limbs16 &res, const Limbs16 &a)
{
	Limbs16 base = a, acc = a;
	Janitor jb(&base, sizeof base), ja(&acc, sizeof acc);

	for (int i = 253; i >= 0; --i) {
		square (acc, acc);
		if (i != 2 && i != 4) {
			mul (acc, acc, base);
		}
	}
	res = acc;
}


std::ostream & operator<< (std::ostream &os, const Limbs16 &rhs)
{
	uint8_t bytes[32];
	std::string s;
	pack (bytes, rhs);
	write_block (s, bytes, sizeof bytes);
	return os << s;
}


void show_raw (std::ostream &os, const char *label, const Limbs16 &a)
{
	os << label << ": " << std::hex << std::setfill('0');
	for (int i = 0; i < limb_count; ++i) {
		if (a.v[i] < 0) {
			os << "-0x" << std::setw(4) << -a.v[i] << ' ';
		} else {
			os << "0x" << std::setw(4) << a.v[i] << ' ';
		}
	}
	os << '\n' << std::setfill(' ') << std::dec;
}


}}
