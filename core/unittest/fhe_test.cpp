// Copyright 2026 The Vigil Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <iostream>
#include "../fhe_plain.h"
#include "../oracle_local.h"
#include "../../utility/logger.h"

int g_TestsFailed = 0;

void TestFailed(const char* szExpr, uint32_t nLine)
{
	printf("Test failed! Line=%u, Expression: %s\n", nLine, szExpr);
	g_TestsFailed++;
}

#define verify_test(x) \
	do { \
		if (!(x)) \
			TestFailed(#x, __LINE__); \
	} while (false)

namespace vigil::Fhe {

uint64_t DecryptU64(const PlainAdapter& a, const Ciphertext& x)
{
	uint64_t val = 0;
	verify_test(a.Decrypt(x.m_Handle, val));
	return val;
}

void TestAdapter()
{
	PlainAdapter a;

	Ciphertext c0;
	verify_test(!a.IsInitialized(c0));

	ExternalInput inp = a.Encrypt(1000);
	Ciphertext c1 = a.Wrap(inp);
	verify_test(a.IsInitialized(c1));
	verify_test(a.SerializeHandle(c1) != Zero);
	verify_test(DecryptU64(a, c1) == 1000);

	// forged proof
	ExternalInput bad = inp;
	bad.m_Proof[0] ^= 1;
	verify_test(!a.IsInitialized(a.Wrap(bad)));

	bad.m_Proof.clear();
	verify_test(!a.IsInitialized(a.Wrap(bad)));

	// handle nobody registered
	bad = inp;
	bad.m_Handle.m_pData[5] ^= 1;
	verify_test(!a.IsInitialized(a.Wrap(bad)));

	Ciphertext c2 = a.Wrap(a.Encrypt(400));
	verify_test(DecryptU64(a, a.Max(c1, c2)) == 1000);
	verify_test(DecryptU64(a, a.Max(c2, c1)) == 1000);

	verify_test(DecryptU64(a, a.Sub(c1, c2)) == 600);
	verify_test(DecryptU64(a, a.Sub(c2, c1)) == uint64_t(-600)); // wraps

	EncryptedBool b = a.CompareGE(c1, c2);
	verify_test(a.IsInitialized(b));
	verify_test(!a.IsInitialized(Ciphertext{ b.m_Handle }));

	uint64_t val = 5;
	verify_test(a.Decrypt(b.m_Handle, val) && (1 == val));
	verify_test(a.Decrypt(a.CompareGE(c2, c1).m_Handle, val) && (0 == val));
	verify_test(a.Decrypt(a.CompareGE(c1, c1).m_Handle, val) && (1 == val));

	verify_test(!a.Decrypt(bad.m_Handle, val));

	try
	{
		a.Max(c1, c0);
		verify_test(false);
	}
	catch (const std::invalid_argument&)
	{
	}
}

void TestHandles()
{
	PlainAdapter a;

	// fresh encryptions and imports never collide, whatever the value
	ExternalInput inp = a.Encrypt(1000);
	verify_test(a.Encrypt(1000).m_Handle != inp.m_Handle);

	Ciphertext c1 = a.Wrap(inp);
	Ciphertext c1b = a.Wrap(inp);
	verify_test(c1.m_Handle != inp.m_Handle);
	verify_test(c1.m_Handle != c1b.m_Handle);
	verify_test(DecryptU64(a, c1b) == 1000);

	Ciphertext c2 = a.Wrap(a.Encrypt(400));

	// an operation result is a new ciphertext, even when the value doesn't change
	Ciphertext m = a.Max(c1, c2);
	verify_test(m.m_Handle != c1.m_Handle);
	verify_test(a.Max(m, c2).m_Handle != m.m_Handle);

	// same operation over the same operands
	verify_test(a.Max(c1, c2).m_Handle == m.m_Handle);
	verify_test(a.Sub(c1, c2).m_Handle == a.Sub(c1, c2).m_Handle);
	verify_test(a.CompareGE(c1, c2).m_Handle == a.CompareGE(c1, c2).m_Handle);
	verify_test(a.Wrap(7000).m_Handle == a.Wrap(7000).m_Handle);

	// equal values, different operands
	verify_test(a.Max(c1b, c2).m_Handle != m.m_Handle);
	verify_test(a.CompareGE(c1, c2).m_Handle != a.CompareGE(a.Wrap(7000), c2).m_Handle);
	verify_test(a.Wrap(1000).m_Handle != c1.m_Handle);
}

void TestRelease()
{
	PlainAdapter a;

	Ciphertext c1 = a.Wrap(a.Encrypt(1000));
	Ciphertext c2 = a.Wrap(a.Encrypt(400));
	size_t n0 = a.get_Size();

	// repeated temporaries come and go without growing the table
	for (int i = 0; i < 100; i++)
	{
		Ciphertext t = a.Wrap(5000 + i);
		Ciphertext d = a.Sub(t, c1);
		EncryptedBool b = a.CompareGE(d, c2);

		a.Release(d);
		a.Release(t);
		verify_test(a.IsInitialized(b));
		verify_test(a.get_Size() == n0 + 1);

		a.Release(b);
		verify_test(!a.IsInitialized(b));
	}
	verify_test(a.get_Size() == n0);

	// each computation holds its own reference
	EncryptedBool b1 = a.CompareGE(c1, c2);
	EncryptedBool b2 = a.CompareGE(c1, c2);
	a.Release(b1);
	verify_test(a.IsInitialized(b2));
	a.Release(b2);
	verify_test(!a.IsInitialized(b2));

	// the result doesn't depend on its operands staying around
	Ciphertext m = a.Max(c1, c2);
	a.Release(c2);
	verify_test(!a.IsInitialized(c2));
	verify_test(DecryptU64(a, m) == 1000);

	try
	{
		a.Release(c2);
		verify_test(false);
	}
	catch (const std::invalid_argument&)
	{
	}
}

void TestOracle()
{
	PlainAdapter a;
	LocalOracle o(a);

	verify_test(o.get_PublicKey().size() == 32);

	std::vector<Handle> vHandles;
	vHandles.push_back(a.Wrap(1000).m_Handle);
	vHandles.push_back(a.Wrap(500).m_Handle);
	vHandles.push_back(a.CompareGE(a.Wrap(600), a.Wrap(500)).m_Handle);

	RequestID id = o.SubmitDecryptionRequest(vHandles, 11);
	verify_test(id);
	verify_test(o.SubmitDecryptionRequest(vHandles, 11) != id);
	verify_test(o.get_Pending().size() == 2);

	LocalOracle::Response res;
	verify_test(!o.Fulfill(id + 100, res));
	verify_test(o.Fulfill(id, res));
	verify_test(res.m_ID == id);
	verify_test(res.m_iCallback == 11);
	verify_test(o.get_Pending().size() == 1);
	verify_test(!o.Fulfill(id, res)); // answered once

	verify_test(Cleartext::get_Count(res.m_Cleartexts) == 3);
	uint64_t val = 0;
	verify_test(Cleartext::Read(res.m_Cleartexts, 0, val) && (1000 == val));
	verify_test(Cleartext::Read(res.m_Cleartexts, 1, val) && (500 == val));
	verify_test(Cleartext::Read(res.m_Cleartexts, 2, val) && (1 == val));

	verify_test(o.VerifyProof(id, res.m_Cleartexts, res.m_Proof));

	// bound to the request id
	verify_test(!o.VerifyProof(id + 1, res.m_Cleartexts, res.m_Proof));

	// and to the cleartexts
	ByteBuffer ct = res.m_Cleartexts;
	ct[31] ^= 1;
	verify_test(!o.VerifyProof(id, ct, res.m_Proof));

	ByteBuffer sig = res.m_Proof;
	sig[0] ^= 1;
	verify_test(!o.VerifyProof(id, res.m_Cleartexts, sig));

	sig.pop_back();
	verify_test(!o.VerifyProof(id, res.m_Cleartexts, sig));

	// another oracle's key
	LocalOracle o2(a);
	verify_test(!o2.VerifyProof(id, res.m_Cleartexts, res.m_Proof));

	try
	{
		o.SubmitDecryptionRequest(std::vector<Handle>(), 1);
		verify_test(false);
	}
	catch (const std::invalid_argument&)
	{
	}
}

} // namespace vigil::Fhe

int main()
{
	auto logger = vigil::Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_WARNING);

	try
	{
		vigil::Fhe::TestAdapter();
		vigil::Fhe::TestHandles();
		vigil::Fhe::TestRelease();
		vigil::Fhe::TestOracle();
	}
	catch (const std::exception& ex)
	{
		printf("Exception: %s\n", ex.what());
		g_TestsFailed++;
	}

	return g_TestsFailed ? -1 : 0;
}
