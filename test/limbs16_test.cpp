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
#include "hasopt.hpp"
#include <iostream>
#include <random>
#include <vector>
#include <string.h>
#include <stdlib.h>

// Checks of the limb level operations: carries, the codec, the reduction
// in mul and the inversion chain.

using namespace gf25519;

static int errors = 0;

static const uint8_t p_bytes[32] = {
	0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
	0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
	0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
	0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f
};

static const uint8_t one_bytes[32] = { 1 };


static void fail(const char *what, const uint8_t *computed, const uint8_t *expected)
{
	format(std::cout, "Error in %s\n", what);
	show_block(std::cout, "computed", computed, 32);
	show_block(std::cout, "expected", expected, 32);
	++errors;
}


// Little endian comparison with p.
static bool below_p(const uint8_t b[32])
{
	for (int i = 31; i >= 0; --i) {
		if (b[i] != p_bytes[i]) {
			return b[i] < p_bytes[i];
		}
	}
	return false;
}


// Random canonical encodings.
static void random_element(std::mt19937 &mt, uint8_t b[32])
{
	do {
		for (int i = 0; i < 32; ++i) {
			b[i] = mt() & 0xFF;
		}
		b[31] &= 0x7F;
	} while (!below_p(b));
}


static void read_vector(uint8_t b[32], const char *hex)
{
	std::vector<uint8_t> v;
	const char *next;
	if (read_block(hex, &next, v) != 32 || *next) {
		throw_rte("Bad test vector %s", hex);
	}
	memcpy(b, &v[0], 32);
}


static void test_carry()
{
	std::cout << "Testing carry.\n";
	Limbs16 a;
	memset(&a, 0, sizeof a);
	a.v[0] = 0x1ffff;
	carry(a);
	bool ok = a.v[0] == 0xffff && a.v[1] == 1;
	for (int i = 2; i < limb_count; ++i) {
		ok = ok && a.v[i] == 0;
	}
	if (!ok) {
		std::cout << "Error in the carry of 0x1ffff\n";
		show_raw(std::cout, "limbs", a);
		++errors;
	}

	// The carry out of the top limb comes back to the bottom one times 38.
	memset(&a, 0, sizeof a);
	a.v[15] = 0x10000;
	carry(a);
	if (a.v[0] != 38 || a.v[15] != 0) {
		std::cout << "Error in the wraparound carry\n";
		show_raw(std::cout, "limbs", a);
		++errors;
	}

	// Negative limbs borrow from the next limb.
	memset(&a, 0, sizeof a);
	a.v[0] = -1;
	a.v[1] = 1;
	carry(a);
	if (a.v[0] != 0xffff || a.v[1] != 0) {
		std::cout << "Error in the carry of a negative limb\n";
		show_raw(std::cout, "limbs", a);
		++errors;
	}
}


static void test_codec()
{
	std::cout << "Testing unpack and pack.\n";
	uint8_t b[32], out[32];
	Limbs16 a;

	// All bits set. The top bit is dropped and 2²⁵⁵ - 1 ≡ 18.
	memset(b, 0xFF, 32);
	unpack(a, b);
	if (a.v[15] != 0x7fff || a.v[0] != 0xffff) {
		std::cout << "Error: unpack did not mask the top bit\n";
		show_raw(std::cout, "limbs", a);
		++errors;
	}
	pack(out, a);
	uint8_t eighteen[32] = { 18 };
	if (crypto_neq(out, eighteen, 32)) {
		fail("packing 2^255 - 1", out, eighteen);
	}

	// p itself and p + 1 are accepted and reduced.
	unpack(a, p_bytes);
	pack(out, a);
	uint8_t zero[32] = { 0 };
	if (crypto_neq(out, zero, 32)) {
		fail("packing p", out, zero);
	}
	memcpy(b, p_bytes, 32);
	b[0]++;
	unpack(a, b);
	pack(out, a);
	if (crypto_neq(out, one_bytes, 32)) {
		fail("packing p + 1", out, one_bytes);
	}

	// Validating decoder.
	memset(b, 0xFF, 32);
	memset(&a, 0, sizeof a);
	if (unpack_checked(a, b) != -1 || a.v[0] != 0) {
		std::cout << "Error: unpack_checked accepted the top bit\n";
		++errors;
	}
	b[31] = 0x7F;
	if (unpack_checked(a, b) != 0 || a.v[15] != 0x7fff) {
		std::cout << "Error: unpack_checked rejected a valid input\n";
		++errors;
	}
}


static void test_round_trip(std::mt19937 &mt, int n)
{
	format(std::cout, "Testing %d random round trips.\n", n);
	uint8_t b[32], out[32];
	Limbs16 a;
	for (int i = 0; i < n; ++i) {
		random_element(mt, b);
		unpack(a, b);
		pack(out, a);
		if (crypto_neq(b, out, 32)) {
			fail("the round trip", out, b);
			return;
		}
	}
}


static void test_add_sub(std::mt19937 &mt, int n)
{
	format(std::cout, "Testing %d additions and subtractions.\n", n);
	uint8_t ba[32], bb[32], out[32];
	Limbs16 a, b, s;
	for (int i = 0; i < n; ++i) {
		random_element(mt, ba);
		random_element(mt, bb);
		unpack(a, ba);
		unpack(b, bb);
		add(s, a, b);
		sub(s, s, b);
		pack(out, s);
		if (crypto_neq(ba, out, 32)) {
			fail("(a + b) - b", out, ba);
			return;
		}
		// b - a + a after a carry.
		sub(s, b, a);
		carry(s);
		add(s, s, a);
		pack(out, s);
		if (crypto_neq(bb, out, 32)) {
			fail("(b - a) + a", out, bb);
			return;
		}
	}
}


static void test_mul(std::mt19937 &mt, int n)
{
	format(std::cout, "Testing %d multiplications.\n", n);
	uint8_t ba[32], bb[32], o1[32], o2[32];
	Limbs16 a, b, ab, ba_;
	for (int i = 0; i < n; ++i) {
		random_element(mt, ba);
		random_element(mt, bb);
		unpack(a, ba);
		unpack(b, bb);
		mul(ab, a, b);
		mul(ba_, b, a);
		pack(o1, ab);
		pack(o2, ba_);
		if (crypto_neq(o1, o2, 32)) {
			fail("a*b == b*a", o1, o2);
			return;
		}
		// Aliasing of the output with an input.
		mul(a, a, b);
		pack(o2, a);
		if (crypto_neq(o1, o2, 32)) {
			fail("aliased mul", o2, o1);
			return;
		}
	}

	// 2¹²⁸ · 2¹²⁸ = 2²⁵⁶ ≡ 38.
	uint8_t t128[32] = { 0 };
	t128[16] = 1;
	unpack(a, t128);
	square(ab, a);
	pack(o1, ab);
	uint8_t e38[32] = { 38 };
	if (crypto_neq(o1, e38, 32)) {
		fail("2^128 squared", o1, e38);
	}

	// (p - 1)² = 1.
	uint8_t pm1[32];
	memcpy(pm1, p_bytes, 32);
	pm1[0]--;
	unpack(a, pm1);
	square(ab, a);
	pack(o1, ab);
	if (crypto_neq(o1, one_bytes, 32)) {
		fail("(p - 1) squared", o1, one_bytes);
	}

	// sqrt(-1)² = p - 1.
	uint8_t sm1[32];
	read_vector(sm1, "b0a00e4a271beec478e42fad0618432fa7d7fb3d99004d2b0bdfc14f8024832b");
	unpack(a, sm1);
	square(ab, a);
	pack(o1, ab);
	if (crypto_neq(o1, pm1, 32)) {
		fail("sqrt(-1) squared", o1, pm1);
	}
}


static void test_inverse(std::mt19937 &mt, int n)
{
	format(std::cout, "Testing %d inversions.\n", n);
	uint8_t b[32], out[32];
	Limbs16 a, ai, prod;

	for (int i = 0; i < n; ++i) {
		random_element(mt, b);
		if (is_zero(b, 32)) {
			continue;
		}
		unpack(a, b);
		inverse(ai, a);
		mul(prod, a, ai);
		pack(out, prod);
		if (crypto_neq(out, one_bytes, 32)) {
			fail("a * 1/a", out, one_bytes);
			show_block(std::cout, "a       ", b, 32);
			return;
		}
	}

	// 1/2 = (p + 1)/2.
	uint8_t two[32] = { 2 }, half[32];
	read_vector(half, "f7ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff3f");
	unpack(a, two);
	inverse(ai, a);
	pack(out, ai);
	if (crypto_neq(out, half, 32)) {
		fail("1/2", out, half);
	}
	mul(prod, ai, a);
	pack(out, prod);
	if (crypto_neq(out, one_bytes, 32)) {
		fail("2 * 1/2", out, one_bytes);
	}

	// The inverse in place.
	inverse(a, a);
	pack(out, a);
	if (crypto_neq(out, half, 32)) {
		fail("1/2 in place", out, half);
	}

	// 0 has no inverse and the chain yields 0.
	uint8_t zero[32] = { 0 };
	unpack(a, zero);
	inverse(ai, a);
	pack(out, ai);
	if (crypto_neq(out, zero, 32)) {
		fail("1/0", out, zero);
	}
}


static void test_swap(std::mt19937 &mt)
{
	std::cout << "Testing swap.\n";
	uint8_t bp[32], bq[32], op[32], oq[32];
	Limbs16 p, q;
	random_element(mt, bp);
	random_element(mt, bq);
	unpack(p, bp);
	unpack(q, bq);

	swap(p, q, 0);
	pack(op, p);
	pack(oq, q);
	if (crypto_neq(op, bp, 32) || crypto_neq(oq, bq, 32)) {
		fail("swap with 0", op, bp);
	}

	swap(p, q, 1);
	pack(op, p);
	pack(oq, q);
	if (crypto_neq(op, bq, 32) || crypto_neq(oq, bp, 32)) {
		fail("swap with 1", op, bq);
	}

	swap(p, q, 1);
	pack(op, p);
	pack(oq, q);
	if (crypto_neq(op, bp, 32) || crypto_neq(oq, bq, 32)) {
		fail("swap twice", op, bp);
	}

	// The limbs themselves are exchanged, also unnormalized ones.
	Limbs16 r, s;
	for (int i = 0; i < limb_count; ++i) {
		r.v[i] = -i;
		s.v[i] = 0x12345 * i;
	}
	swap(r, s, 1);
	for (int i = 0; i < limb_count; ++i) {
		if (r.v[i] != 0x12345 * i || s.v[i] != -i) {
			std::cout << "Error: swap did not exchange raw limbs\n";
			++errors;
			break;
		}
	}
}


static int real_main(int argc, char **argv)
{
	int n = 500;
	const char *val;
	int c;
	while ((c = hasopt(&argc, argv, "n:", &val)) != 0) {
		if (c == 'n') {
			n = atoi(val);
		} else {
			std::cerr << "usage is limbs16_test [-n count]\n";
			return 1;
		}
	}

	std::mt19937 mt(25519);
	test_carry();
	test_codec();
	test_round_trip(mt, n);
	test_add_sub(mt, n);
	test_mul(mt, n);
	test_inverse(mt, n / 10 + 1);
	test_swap(mt);

	format(std::cout, "%d errors found.\n", errors);
	return errors == 0 ? 0 : 1;
}


int main(int argc, char **argv)
{
	return run_main(argc, argv, real_main);
}
