#ifndef GF25519_FE25519_HPP
#define GF25519_FE25519_HPP

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


#include <stdint.h>
#include <string.h>
#include <iosfwd>
#include "soname.hpp"
#include "limbs16.hpp"

// Field elements modulo 2²⁵⁵ - 19 as value types. The limb layout is
// private. The normalization state is part of the type:
//
// Fe       carried limbs. Produced by unpack, mul, square, inverse and by
//          carrying an Fe_sum. Only an Fe can be multiplied, inverted,
//          swapped or packed.
//
// Fe_sum   the result of add and sub. Limbs may be out of range or
//          negative. Sums can be extended with further add and sub, up to
//          2⁴⁰ terms, and must be carried before any other use.
//
// Fe_bytes the canonical 32 byte little endian encoding.
//
// All functions accept an output that aliases one of the inputs.

namespace gf25519 {  inline namespace GF25519_SONAME {

struct Fe_bytes {
	uint8_t b[32];
};

struct Fe_access;

class EXPORTFN Fe {
	Limbs16 l;
	friend struct Fe_access;
public:
	Fe() { memset (&l, 0, sizeof l); }
	// Small constants.
	explicit Fe(uint16_t n) { memset (&l, 0, sizeof l); l.v[0] = n; }
	// Same as unpack.
	explicit Fe(const Fe_bytes &eb);
};

class EXPORTFN Fe_sum {
	Limbs16 l;
	friend struct Fe_access;
public:
	Fe_sum() { memset (&l, 0, sizeof l); }
	// An Fe is a sum of one term.
	Fe_sum(const Fe &fe);
};


// Decoding ignores the top bit of the last byte.
EXPORTFN void unpack (Fe &res, const uint8_t b[32]);
EXPORTFN void unpack (Fe &res, const Fe_bytes &b);

// Validating decoder. Returns -1 and leaves res untouched if the top bit
// is set. Returns 0 otherwise.
EXPORTFN int unpack_checked (Fe &res, const uint8_t b[32]);

// Canonical encoding in [0, p).
EXPORTFN void pack (uint8_t b[32], const Fe &a);
EXPORTFN void pack (Fe_bytes &b, const Fe &a);

EXPORTFN void add (Fe_sum &res, const Fe_sum &a, const Fe_sum &b);
EXPORTFN void sub (Fe_sum &res, const Fe_sum &a, const Fe_sum &b);

// Two carry passes. The result satisfies the bounds of Fe.
EXPORTFN void carry (Fe &res, const Fe_sum &a);

EXPORTFN void mul (Fe &res, const Fe &a, const Fe &b);
EXPORTFN void square (Fe &res, const Fe &a);

// 1/a. inverse of 0 is 0.
EXPORTFN void inverse (Fe &res, const Fe &a);

// Exchange p and q if bit is 1. Nothing if bit is 0. Constant time.
EXPORTFN void swap (Fe &p, Fe &q, int64_t bit);

// Return 1 if a ≡ 0, 0 otherwise. Constant time.
EXPORTFN int is_zero (const Fe &a);

// Return 1 if a ≡ b, 0 otherwise. Constant time.
EXPORTFN int equal (const Fe &a, const Fe &b);

// Write the canonical encoding as hex.
EXPORTFN std::ostream & operator<< (std::ostream &os, const Fe &rhs);
EXPORTFN std::ostream & operator<< (std::ostream &os, const Fe_bytes &rhs);

// Show the limbs of the element.
EXPORTFN void show_raw (std::ostream &os, const char *label, const Fe &a);
EXPORTFN void show_raw (std::ostream &os, const char *label, const Fe_sum &a);


}}

#endif
