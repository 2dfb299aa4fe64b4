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

#pragma once
#include "oracle.h"
#include "fhe_plain.h"
#include <map>

typedef struct evp_pkey_st EVP_PKEY;

namespace vigil::Fhe
{
	// In-process decryption oracle over the PlainAdapter.
	// Responses are attested by an Ed25519 signature over Hash(request id, cleartexts).
	class LocalOracle
		:public IDecryptionOracle
	{
		const PlainAdapter& m_Adapter;
		EVP_PKEY* m_pSk;
		EVP_PKEY* m_pPk;
		RequestID m_LastID = 0;

		struct Pending
		{
			std::vector<Handle> m_vHandles;
			uint32_t m_iCallback;
		};

		std::map<RequestID, Pending> m_Pending;

	public:

		struct Response
		{
			RequestID m_ID;
			uint32_t m_iCallback;
			ByteBuffer m_Cleartexts;
			ByteBuffer m_Proof;
		};

		LocalOracle(const PlainAdapter&);
		~LocalOracle();

		LocalOracle(const LocalOracle&) = delete;
		LocalOracle& operator = (const LocalOracle&) = delete;

		// decrypts and signs a pending request. Returns false if the request is unknown or already fulfilled.
		// Throws if a committed handle can't be decrypted
		bool Fulfill(RequestID, Response&);

		std::vector<RequestID> get_Pending() const;

		ByteBuffer get_PublicKey() const;

		static void get_Msg(Hash::Value&, RequestID, const Blob& cleartexts);

		// IDecryptionOracle
		RequestID SubmitDecryptionRequest(const std::vector<Handle>&, uint32_t iCallback) override;
		bool VerifyProof(RequestID, const Blob& cleartexts, const Blob& proof) const override;
	};

} // namespace vigil::Fhe
