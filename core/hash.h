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

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace vigil
{
	struct Hash
	{
		typedef uintBig_t<32> Value;

		class Processor;
	};

	// SHA-256
	class Hash::Processor
	{
		EVP_MD_CTX* m_pCtx;
		bool m_bInitialized;

		void Write(bool);
		void Write(uint8_t);
		void Write(const Blob&);
		template <uint32_t nBytes_>
		void Write(const uintBig_t<nBytes_>& x) { Write(x.m_pData, x.nBytes); }
		template <uint32_t n>
		void Write(const char(&sz)[n]) { Write(sz, n); }
		void Write(const std::string& str) { Write(str.c_str(), static_cast<uint32_t>(str.size() + 1)); }

		template <typename T>
		void Write(T v)
		{
			// Must be independent of the endian-ness
			// Must prevent ambiguities (different inputs should be properly distinguished)
			// Make it also independent of the actual type width, so that size_t (and friends) will be treated the same on all the platforms
			static_assert(T(-1) > 0, "must be unsigned");

			for (; v >= 0x80; v >>= 7)
				Write(uint8_t(uint8_t(v) | 0x80));

			Write(uint8_t(v));
		}

		void Finalize(Value&);

	public:
		Processor();
		~Processor();

		Processor(const Processor&) = delete;
		Processor& operator = (const Processor&) = delete;

		void Reset();

		template <typename T>
		Processor& operator << (const T& t) { Write(t); return *this; }

		void operator >> (Value& hv) { Finalize(hv); }

		void Write(const void*, uint32_t);
	};

} // namespace vigil
