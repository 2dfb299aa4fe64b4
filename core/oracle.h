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
#include "fhe.h"

namespace vigil::Fhe
{
	typedef uint64_t RequestID;

	// Confidential decryption service. Decrypts a committed ordered set of handles
	// and answers asynchronously with cleartexts plus an attestation.
	struct IDecryptionOracle
	{
		virtual ~IDecryptionOracle() = default;

		virtual RequestID SubmitDecryptionRequest(const std::vector<Handle>&, uint32_t iCallback) = 0;

		// checks the attestation for exactly this (request, cleartexts) pair
		virtual bool VerifyProof(RequestID, const Blob& cleartexts, const Blob& proof) const = 0;
	};

	// Cleartext encoding in oracle responses: one 32-byte big-endian word per handle, in request order.
	struct Cleartext
	{
		typedef uintBig_t<32> Word;

		static void Append(ByteBuffer&, uint64_t);
		static uint32_t get_Count(const Blob&); // returns 0 if the blob isn't a whole number of words
		static bool Read(const Blob&, uint32_t iWord, uint64_t&); // false if out of range or doesn't fit in 64 bits
	};

} // namespace vigil::Fhe
