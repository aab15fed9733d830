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

#include "fe25519.hpp"
#include "misc.hpp"
#include <iostream>
#include <string>

namespace gf25519 {  namespace GF25519_SONAME {

struct Fe_access {
	static Limbs16 & limbs (Fe &fe) { return fe.l; }
	static const Limbs16 & limbs (const Fe &fe) { return fe.l; }
	static Limbs16 & limbs (Fe_sum &s) { return s.l; }
	static const Limbs16 & limbs (const Fe_sum &s) { return s.l; }
};

typedef Fe_access A;


Fe::Fe(const Fe_bytes &eb)
{
	gf25519::unpack (l, eb.b);
}

Fe_sum::Fe_sum(const Fe &fe) : l(A::limbs(fe))
{
}


void unpack (Fe &res, const uint8_t b[32])
{
	unpack (A::limbs(res), b);
}

void unpack (Fe &res, const Fe_bytes &b)
{
	unpack (A::limbs(res), b.b);
}

int unpack_checked (Fe &res, const uint8_t b[32])
{
	return unpack_checked (A::limbs(res), b);
}

void pack (uint8_t b[32], const Fe &a)
{
	pack (b, A::limbs(a));
}

void pack (Fe_bytes &b, const Fe &a)
{
	pack (b.b, A::limbs(a));
}

void add (Fe_sum &res, const Fe_sum &a, const Fe_sum &b)
{
	add (A::limbs(res), A::limbs(a), A::limbs(b));
}

void sub (Fe_sum &res, const Fe_sum &a, const Fe_sum &b)
{
	sub (A::limbs(res), A::limbs(a), A::limbs(b));
}

void carry (Fe &res, const Fe_sum &a)
{
	Limbs16 &r = A::limbs(res);
	r = A::limbs(a);
	// The first pass leaves v[0] with up to 38 times the top carry. The
	// second one ripples it back so that v[0] is within 38 of [0, 2¹⁶).
	carry (r);
	carry (r);
}

void mul (Fe &res, const Fe &a, const Fe &b)
{
	mul (A::limbs(res), A::limbs(a), A::limbs(b));
}

void square (Fe &res, const Fe &a)
{
	square (A::limbs(res), A::limbs(a));
}

void inverse (Fe &res, const Fe &a)
{
	inverse (A::limbs(res), A::limbs(a));
}

void swap (Fe &p, Fe &q, int64_t bit)
{
	swap (A::limbs(p), A::limbs(q), bit);
}

int is_zero (const Fe &a)
{
	uint8_t b[32];
	pack (b, A::limbs(a));
	int res = is_zero (b, 32);
	crypto_bzero (b, 32);
	return res;
}

int equal (const Fe &a, const Fe &b)
{
	uint8_t ba[32], bb[32];
	Janitor ja(ba, 32), jb(bb, 32);
	pack (ba, A::limbs(a));
	pack (bb, A::limbs(b));
	return crypto_neq (ba, bb, 32) ^ 1;
}

std::ostream & operator<< (std::ostream &os, const Fe &rhs)
{
	return os << A::limbs(rhs);
}

std::ostream & operator<< (std::ostream &os, const Fe_bytes &rhs)
{
	std::string s;
	write_block (s, rhs.b, sizeof rhs.b);
	return os << s;
}

void show_raw (std::ostream &os, const char *label, const Fe &a)
{
	show_raw (os, label, A::limbs(a));
}

void show_raw (std::ostream &os, const char *label, const Fe_sum &a)
{
	show_raw (os, label, A::limbs(a));
}


}}
