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
#include "uintBig.h"

namespace vigil::Fhe
{
	// opaque reference to a ciphertext, as published on the ledger
	typedef uintBig_t<32> Handle;

	// encrypted 64-bit unsigned integer. Zero handle means uninitialized
	struct Ciphertext
	{
		Handle m_Handle;
	};

	struct EncryptedBool
	{
		Handle m_Handle;
	};

	// ciphertext produced off-chain by a client, with the proof that it was encrypted under the network key
	struct ExternalInput
	{
		Handle m_Handle;
		ByteBuffer m_Proof;
	};

	// Encrypted arithmetic capability.
	// Operations are deterministic: the same operation over the same operand handles always yields the same handle.
	// Importing an external input always yields a fresh handle, so every overwrite produces a new ciphertext.
	struct IAdapter
	{
		virtual ~IAdapter() = default;

		// returns uninitialized ciphertext if the input isn't valid
		virtual Ciphertext Wrap(const ExternalInput&) = 0;
		// trivial encryption of a public value
		virtual Ciphertext Wrap(uint64_t) = 0;

		virtual Ciphertext Max(const Ciphertext&, const Ciphertext&) = 0;
		virtual Ciphertext Sub(const Ciphertext&, const Ciphertext&) = 0; // modulo 2^64
		virtual EncryptedBool CompareGE(const Ciphertext&, const Ciphertext&) = 0;

		virtual bool IsInitialized(const Ciphertext&) const = 0;
		virtual bool IsInitialized(const EncryptedBool&) const = 0;

		virtual Handle SerializeHandle(const Ciphertext&) const = 0;
		virtual Handle SerializeHandle(const EncryptedBool&) const = 0;

		// drops one reference to an intermediate result the caller no longer needs
		virtual void Release(const Ciphertext&) = 0;
		virtual void Release(const EncryptedBool&) = 0;
	};

} // namespace vigil::Fhe
