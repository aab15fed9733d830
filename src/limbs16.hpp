#ifndef GF25519_LIMBS16_HPP
#define GF25519_LIMBS16_HPP

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
#include <iosfwd>
#include "soname.hpp"

// Operations in the field modulo 2²⁵⁵ - 19 on a plain limb array.

namespace gf25519 {  inline namespace GF25519_SONAME {

// An integer of 255 bits is stored in sixteen signed 64 bit limbs of 16
// bits each in the normalized form: value = Σ v[i]·2^(16·i). The limbs are
// redundant. Additions and subtractions do not propagate carries and may
// leave any limb outside of [0, 2¹⁶), even negative. A carry pass brings
// the limbs back to [0, 2¹⁶) except for v[0], which receives 38 times the
// carry out of v[15] because 2²⁵⁶ ≡ 38 (mod p).

// Bounds. A normalized limb is below 2¹⁷ in magnitude. Each add or sub of
// normalized inputs adds less than 2¹⁸. mul accepts limbs below 2²⁶ in
// magnitude: 16 products of 2⁵² plus the fold by 38 stay below 2⁶³. Chains
// of additions must be carried before they approach 2²⁶ if they are going
// to be multiplied and before they approach 2⁶² in any case.

enum { limb_count = 16, limb_bits = 16 };

struct Limbs16 {
	int64_t v[limb_count];
};


// Load the bytes from b into the limb representation. The top bit of b[31]
// is ignored, so the value is always below 2²⁵⁵.
EXPORTFN void unpack (Limbs16 &res, const uint8_t b[32]);

// Same as unpack but returns -1 without touching res if the top bit of
// b[31] is set. Returns 0 otherwise.
EXPORTFN int unpack_checked (Limbs16 &res, const uint8_t b[32]);

// Reduce a copy of a to the nominal ranges, mod p, and store the canonical
// bytes in b. Accepts any redundant input within the bounds above.
EXPORTFN void pack (uint8_t b[32], const Limbs16 &a);

// Arithmetic without carries.
inline void add (Limbs16 &res, const Limbs16 &a, const Limbs16 &b);
inline void sub (Limbs16 &res, const Limbs16 &a, const Limbs16 &b);

// Multiplication with reduction and two carry passes. res may alias a or b.
inline void mul (Limbs16 &res, const Limbs16 &a, const Limbs16 &b);
inline void square (Limbs16 &res, const Limbs16 &a);

// One carry pass.
inline void carry (Limbs16 &a);

// Compute 1/a by raising a to p-2 = 2²⁵⁵ - 21. When a ≡ 0 then it sets
// res = 0.
EXPORTFN void inverse (Limbs16 &res, const Limbs16 &a);

// Swap if bit is 1. Bit may be either 1 or 0. No other values are accepted.
inline void swap (Limbs16 &p, Limbs16 &q, int64_t bit);

// Write the canonical bytes as hex.
EXPORTFN std::ostream & operator<< (std::ostream &os, const Limbs16 &rhs);

// Show the limb values.
EXPORTFN void show_raw (std::ostream &os, const char *label, const Limbs16 &a);




// Inline implementations.

inline void add (Limbs16 &res, const Limbs16 &a, const Limbs16 &b)
{
	for (int i = 0; i < limb_count; ++i) {
		res.v[i] = a.v[i] + b.v[i];
	}
}

inline void sub (Limbs16 &res, const Limbs16 &a, const Limbs16 &b)
{
	for (int i = 0; i < limb_count; ++i) {
		res.v[i] = a.v[i] - b.v[i];
	}
}

inline void carry (Limbs16 &a)
{
	int64_t c;
	for (int i = 0; i < limb_count; ++i) {
		// Arithmetic shift. Negative limbs borrow from the next one.
		c = a.v[i] >> limb_bits;
		a.v[i] -= c * (int64_t(1) << limb_bits);
		if (i < limb_count - 1) {
			a.v[i + 1] += c;
		} else {
			a.v[0] += 38 * c;
		}
	}
}

inline void mul (Limbs16 &res, const Limbs16 &a, const Limbs16 &b)
{
	int64_t product[2*limb_count] = { 0 };

	for (int i = 0; i < limb_count; ++i) {
		for (int j = 0; j < limb_count; ++j) {
			product[i + j] += a.v[i] * b.v[j];
		}
	}
	// 2²⁵⁶ ≡ 38. product[31] is never written, so limb 15 gets no fold.
	for (int i = 0; i < limb_count - 1; ++i) {
		product[i] += 38 * product[i + limb_count];
	}
	for (int i = 0; i < limb_count; ++i) {
		res.v[i] = product[i];
	}
	carry (res);
	carry (res);
}

inline void square (Limbs16 &res, const Limbs16 &a)
{
	mul (res, a, a);
}

inline void swap (Limbs16 &p, Limbs16 &q, int64_t bit)
{
	int64_t c = ~(bit - 1);     // All ones if bit == 1, all zero if bit == 0.
	int64_t t;
	for (int i = 0; i < limb_count; ++i) {
		t = c & (p.v[i] ^ q.v[i]);
		p.v[i] ^= t;
		q.v[i] ^= t;
	}
}


}}

#endif
