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

#include "oracle_local.h"
#include "../utility/logger.h"
#include <openssl/evp.h>
#include <stdexcept>

namespace vigil::Fhe
{
	namespace
	{
		struct MdCtxDeleter {
			void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
		};

		struct PkeyCtxDeleter {
			void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
		};

		typedef std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> MdCtxPtr;
		typedef std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> PkeyCtxPtr;

		const size_t s_nSignatureSize = 64;
	}

	LocalOracle::LocalOracle(const PlainAdapter& a)
		:m_Adapter(a)
		,m_pSk(nullptr)
		,m_pPk(nullptr)
	{
		PkeyCtxPtr pCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
		if (!pCtx || (EVP_PKEY_keygen_init(pCtx.get()) <= 0) || (EVP_PKEY_keygen(pCtx.get(), &m_pSk) <= 0))
			throw std::runtime_error("oracle: key generation failed");

		// verification uses only the public part, as a remote verifier would
		uint8_t pPk[32];
		size_t nPk = sizeof(pPk);
		if (EVP_PKEY_get_raw_public_key(m_pSk, pPk, &nPk) <= 0)
		{
			EVP_PKEY_free(m_pSk);
			throw std::runtime_error("oracle: public key export failed");
		}

		m_pPk = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pPk, nPk);
		if (!m_pPk)
		{
			EVP_PKEY_free(m_pSk);
			throw std::runtime_error("oracle: public key import failed");
		}
	}

	LocalOracle::~LocalOracle()
	{
		EVP_PKEY_free(m_pPk);
		EVP_PKEY_free(m_pSk);
	}

	ByteBuffer LocalOracle::get_PublicKey() const
	{
		ByteBuffer res(32);
		size_t n = res.size();
		if (EVP_PKEY_get_raw_public_key(m_pPk, res.data(), &n) <= 0)
			throw std::runtime_error("oracle: public key export failed");

		res.resize(n);
		return res;
	}

	void LocalOracle::get_Msg(Hash::Value& hv, RequestID id, const Blob& cleartexts)
	{
		Hash::Processor hp;
		hp
			<< "oracle.decryption.result"
			<< id
			<< cleartexts.n;

		hp.Write(cleartexts.p, cleartexts.n);
		hp >> hv;
	}

	RequestID LocalOracle::SubmitDecryptionRequest(const std::vector<Handle>& vHandles, uint32_t iCallback)
	{
		if (vHandles.empty())
			throw std::invalid_argument("oracle: empty decryption request");

		RequestID id = ++m_LastID;

		Pending& p = m_Pending[id];
		p.m_vHandles = vHandles;
		p.m_iCallback = iCallback;

		LOG_DEBUG() << "oracle: request " << id << " queued, " << vHandles.size() << " handles";
		return id;
	}

	bool LocalOracle::Fulfill(RequestID id, Response& res)
	{
		auto it = m_Pending.find(id);
		if (m_Pending.end() == it)
			return false;

		const Pending& p = it->second;

		res.m_ID = id;
		res.m_iCallback = p.m_iCallback;
		res.m_Cleartexts.clear();

		for (const auto& h : p.m_vHandles)
		{
			uint64_t val = 0;
			if (!m_Adapter.Decrypt(h, val))
				throw std::runtime_error("oracle: can't decrypt handle " + h.str());

			Cleartext::Append(res.m_Cleartexts, val);
		}

		Hash::Value hv;
		get_Msg(hv, id, res.m_Cleartexts);

		MdCtxPtr pCtx(EVP_MD_CTX_new());
		res.m_Proof.resize(s_nSignatureSize);
		size_t nSig = res.m_Proof.size();

		if (!pCtx ||
			(EVP_DigestSignInit(pCtx.get(), nullptr, nullptr, nullptr, m_pSk) <= 0) ||
			(EVP_DigestSign(pCtx.get(), res.m_Proof.data(), &nSig, hv.m_pData, hv.nBytes) <= 0))
			throw std::runtime_error("oracle: signing failed");

		res.m_Proof.resize(nSig);
		m_Pending.erase(it);

		LOG_DEBUG() << "oracle: request " << id << " fulfilled";
		return true;
	}

	std::vector<RequestID> LocalOracle::get_Pending() const
	{
		std::vector<RequestID> v;
		v.reserve(m_Pending.size());
		for (const auto& x : m_Pending)
			v.push_back(x.first);
		return v;
	}

	bool LocalOracle::VerifyProof(RequestID id, const Blob& cleartexts, const Blob& proof) const
	{
		if (proof.n != s_nSignatureSize)
			return false;

		Hash::Value hv;
		get_Msg(hv, id, cleartexts);

		MdCtxPtr pCtx(EVP_MD_CTX_new());
		if (!pCtx || (EVP_DigestVerifyInit(pCtx.get(), nullptr, nullptr, nullptr, m_pPk) <= 0))
			throw std::runtime_error("oracle: verifier init failed");

		return EVP_DigestVerify(pCtx.get(), static_cast<const uint8_t*>(proof.p), proof.n, hv.m_pData, hv.nBytes) == 1;
	}

} // namespace vigil::Fhe
