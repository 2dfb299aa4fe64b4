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

#include "fhe_plain.h"
#include "../utility/logger.h"
#include <stdexcept>
#include <cassert>

namespace vigil::Fhe
{
	void PlainAdapter::Register(const Handle& h, Type::Enum type, uint64_t val)
	{
		auto it = m_Table.find(h);
		if (m_Table.end() != it)
		{
			// same operation over the same operands
			assert((it->second.m_Type == type) && (it->second.m_Value == val));
			it->second.m_Refs++;
			return;
		}

		Entry& e = m_Table[h];
		e.m_Type = type;
		e.m_Value = val;
		e.m_Refs = 1;
	}

	Handle PlainAdapter::get_FreshHandle(const char* szTag, const Handle& hSrc)
	{
		Handle h;
		Hash::Processor()
			<< std::string(szTag)
			<< hSrc
			<< ++m_Nonce
			>> h;
		return h;
	}

	void PlainAdapter::get_OpHandle(Handle& h, Op::Enum op, const Handle& a, const Handle& b)
	{
		Hash::Processor()
			<< "fhe.plain.op"
			<< static_cast<uint8_t>(op)
			<< a
			<< b
			>> h;
	}

	const PlainAdapter::Entry& PlainAdapter::Get(const Handle& h, Type::Enum type) const
	{
		auto it = m_Table.find(h);
		if ((m_Table.end() == it) || (it->second.m_Type != type))
			throw std::invalid_argument("unknown ciphertext handle " + h.str());

		return it->second;
	}

	void PlainAdapter::get_InputProof(Hash::Value& hv, const Handle& h)
	{
		Hash::Processor()
			<< "fhe.plain.input"
			<< h
			>> hv;
	}

	ExternalInput PlainAdapter::Encrypt(uint64_t val)
	{
		ExternalInput res;
		res.m_Handle = get_FreshHandle("fhe.plain.ct", Zero);
		Register(res.m_Handle, Type::U64, val);

		Hash::Value hv;
		get_InputProof(hv, res.m_Handle);
		Blob(hv).Export(res.m_Proof);

		return res;
	}

	bool PlainAdapter::Decrypt(const Handle& h, uint64_t& val) const
	{
		auto it = m_Table.find(h);
		if (m_Table.end() == it)
			return false;

		val = it->second.m_Value;
		return true;
	}

	Ciphertext PlainAdapter::Wrap(const ExternalInput& inp)
	{
		Ciphertext res;

		auto it = m_Table.find(inp.m_Handle);
		if ((m_Table.end() == it) || (Type::U64 != it->second.m_Type))
		{
			LOG_DEBUG() << "fhe: unknown input handle " << inp.m_Handle;
			return res;
		}

		Hash::Value hv;
		get_InputProof(hv, inp.m_Handle);
		if (Blob(hv) != Blob(inp.m_Proof))
		{
			LOG_DEBUG() << "fhe: bad input proof for " << inp.m_Handle;
			return res;
		}

		// each import is a new ciphertext, even for an input seen before
		res.m_Handle = get_FreshHandle("fhe.plain.import", inp.m_Handle);
		Register(res.m_Handle, Type::U64, it->second.m_Value);
		return res;
	}

	Ciphertext PlainAdapter::Wrap(uint64_t val)
	{
		Handle hVal;
		hVal.AssignOrdinal(val);

		Ciphertext res;
		get_OpHandle(res.m_Handle, Op::Trivial, hVal, Zero);
		Register(res.m_Handle, Type::U64, val);
		return res;
	}

	Ciphertext PlainAdapter::Max(const Ciphertext& a, const Ciphertext& b)
	{
		uint64_t val = Get(a.m_Handle, Type::U64).m_Value;
		std::setmax(val, Get(b.m_Handle, Type::U64).m_Value);

		Ciphertext res;
		get_OpHandle(res.m_Handle, Op::Max, a.m_Handle, b.m_Handle);
		Register(res.m_Handle, Type::U64, val);
		return res;
	}

	Ciphertext PlainAdapter::Sub(const Ciphertext& a, const Ciphertext& b)
	{
		uint64_t val = Get(a.m_Handle, Type::U64).m_Value - Get(b.m_Handle, Type::U64).m_Value;

		Ciphertext res;
		get_OpHandle(res.m_Handle, Op::Sub, a.m_Handle, b.m_Handle);
		Register(res.m_Handle, Type::U64, val);
		return res;
	}

	EncryptedBool PlainAdapter::CompareGE(const Ciphertext& a, const Ciphertext& b)
	{
		bool bGE = (Get(a.m_Handle, Type::U64).m_Value >= Get(b.m_Handle, Type::U64).m_Value);

		EncryptedBool res;
		get_OpHandle(res.m_Handle, Op::CompareGE, a.m_Handle, b.m_Handle);
		Register(res.m_Handle, Type::Bool, bGE ? 1 : 0);
		return res;
	}

	bool PlainAdapter::IsInitialized(const Ciphertext& x) const
	{
		auto it = m_Table.find(x.m_Handle);
		return (m_Table.end() != it) && (Type::U64 == it->second.m_Type);
	}

	bool PlainAdapter::IsInitialized(const EncryptedBool& x) const
	{
		auto it = m_Table.find(x.m_Handle);
		return (m_Table.end() != it) && (Type::Bool == it->second.m_Type);
	}

	Handle PlainAdapter::SerializeHandle(const Ciphertext& x) const
	{
		return x.m_Handle;
	}

	Handle PlainAdapter::SerializeHandle(const EncryptedBool& x) const
	{
		return x.m_Handle;
	}

	void PlainAdapter::ReleaseInternal(const Handle& h)
	{
		auto it = m_Table.find(h);
		if (m_Table.end() == it)
			throw std::invalid_argument("unknown ciphertext handle " + h.str());

		if (!--it->second.m_Refs)
			m_Table.erase(it);
	}

	void PlainAdapter::Release(const Ciphertext& x)
	{
		ReleaseInternal(x.m_Handle);
	}

	void PlainAdapter::Release(const EncryptedBool& x)
	{
		ReleaseInternal(x.m_Handle);
	}

} // namespace vigil::Fhe
