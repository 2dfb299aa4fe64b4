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

#include "oracle.h"

namespace vigil::Fhe
{
	void Cleartext::Append(ByteBuffer& buf, uint64_t val)
	{
		Word w;
		w.AssignOrdinal(val);
		buf.insert(buf.end(), w.m_pData, w.m_pData + w.nBytes);
	}

	uint32_t Cleartext::get_Count(const Blob& b)
	{
		if (b.n % Word::nBytes)
			return 0;
		return b.n / Word::nBytes;
	}

	bool Cleartext::Read(const Blob& b, uint32_t iWord, uint64_t& val)
	{
		if (iWord >= get_Count(b))
			return false;

		Word w = Blob(static_cast<const uint8_t*>(b.p) + iWord * Word::nBytes, Word::nBytes);
		return w.ExportOrdinal(val);
	}

} // namespace vigil::Fhe
