#ifndef GF25519_MISC_HPP
#define GF25519_MISC_HPP

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
#include <stddef.h>
#include <iosfwd>
#include <string>
#include <vector>
#include "soname.hpp"


// Byte level support: constant time comparison, wiping and hexadecimal
// blocks.


namespace gf25519 {    inline namespace GF25519_SONAME  {


// Read and write 16 bit little endian values from unaligned storage.
inline uint16_t leget16 (const uint8_t *b)
{
	return uint16_t(uint16_t(b[1]) << 8 | b[0]);
}

inline void leput16 (uint8_t *dest, uint16_t value)
{
	dest[0] = value & 0xFF;
	dest[1] = value >> 8;
}


// Return 0 if both byte arrays are equal. 1 if they differ. This works in
// constant time.
EXPORTFN int crypto_neq(const void *v1, const void *v2, size_t n);

// Constant time check if v1[0..n[ is zero. Returns 1 if zero. O otherwise.
EXPORTFN int is_zero(const void *v1, size_t n);

// Out of line version of memset(0). The compiler may not remove it.
EXPORTFN void crypto_bzero(void *p, size_t n);

// Zero the given block when leaving the scope.
class EXPORTFN Janitor {
	void *p;
	size_t n;
public:
	Janitor(void *pp, size_t nn) : p(pp), n(nn) {}
	~Janitor() { crypto_bzero (p, n); }
};


// Write and read a block as a sequence of hex digits.
EXPORTFN
void show_block(std::ostream &os, const char *label, const void *b,
                size_t nbytes, int group=4);

EXPORTFN
void write_block(std::string &dst, const void *b, size_t nbytes);

// Read hex digits from in and store the bytes in dst. Spaces between the
// digits are skipped. Store in *next the pointer to the first character
// that is not a hex digit (the terminating null if everything was read).
// Returns the number of bytes read or -1 if the input ends in the middle of
// a byte.
EXPORTFN
ptrdiff_t read_block(const char *in, const char **next,
                     std::vector<uint8_t> &dst);


}}

#endif
