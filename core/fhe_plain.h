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
#include "hash.h"
#include <map>

namespace vigil::Fhe
{
	// Cleartext stand-in for the encrypted arithmetic backend.
	// Values live in a private handle table, callers only ever see handles.
	// Operation results are keyed by the operation and its operand handles, fresh encryptions and imports by a nonce.
	// Entries are reference-counted, an entry goes away once its last reference is released.
	class PlainAdapter
		:public IAdapter
	{
		struct Type {
			enum Enum : uint8_t {
				U64 = 1,
				Bool = 2,
			};
		};

		struct Op {
			enum Enum : uint8_t {
				Trivial = 1,
				Max = 2,
				Sub = 3,
				CompareGE = 4,
			};
		};

		struct Entry
		{
			Type::Enum m_Type;
			uint64_t m_Value;
			uint32_t m_Refs;
		};

		std::map<Handle, Entry> m_Table;
		uint64_t m_Nonce = 0;

		void Register(const Handle&, Type::Enum, uint64_t);
		Handle get_FreshHandle(const char* szTag, const Handle&);
		static void get_OpHandle(Handle&, Op::Enum, const Handle&, const Handle&);
		const Entry& Get(const Handle&, Type::Enum) const;
		void ReleaseInternal(const Handle&);

		static void get_InputProof(Hash::Value&, const Handle&);

	public:

		// client side: encrypt a value for submission
		ExternalInput Encrypt(uint64_t);

		// decryption side, used by the oracle. Bools decrypt to 0/1
		bool Decrypt(const Handle&, uint64_t&) const;

		size_t get_Size() const { return m_Table.size(); }

		// IAdapter
		Ciphertext Wrap(const ExternalInput&) override;
		Ciphertext Wrap(uint64_t) override;
		Ciphertext Max(const Ciphertext&, const Ciphertext&) override;
		Ciphertext Sub(const Ciphertext&, const Ciphertext&) override;
		EncryptedBool CompareGE(const Ciphertext&, const Ciphertext&) override;
		bool IsInitialized(const Ciphertext&) const override;
		bool IsInitialized(const EncryptedBool&) const override;
		Handle SerializeHandle(const Ciphertext&) const override;
		Handle SerializeHandle(const EncryptedBool&) const override;
		void Release(const Ciphertext&) override;
		void Release(const EncryptedBool&) override;
	};

} // namespace vigil::Fhe
