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
#include "../core/oracle.h"

namespace vigil
{
	// account address
	typedef uintBig_t<20> Identity;

	typedef uint64_t BatchID;

	using Fhe::RequestID;

	// Per-call transaction context supplied by the host: who calls, and the ledger time
	struct Context
	{
		Identity m_Caller;
		Timestamp m_Now = 0;
	};

} // namespace vigil
