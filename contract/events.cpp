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

#include "events.h"

namespace vigil
{
	namespace Event
	{
		const char* Type::get_Name(Enum t)
		{
			switch (t)
			{
#define THE_MACRO(name) case name: return #name;
				VigilEventsAll(THE_MACRO)
#undef THE_MACRO
			}
			return "unknown";
		}

		void OwnershipTransferred::Print(std::ostream& os) const
		{
			os << "prev=" << m_Prev << " new=" << m_New;
		}

		void ProviderAdded::Print(std::ostream& os) const
		{
			os << "provider=" << m_Provider;
		}

		void ProviderRemoved::Print(std::ostream& os) const
		{
			os << "provider=" << m_Provider;
		}

		void PausedToggled::Print(std::ostream& os) const
		{
			os << "paused=" << m_Paused;
		}

		void CooldownUpdated::Print(std::ostream& os) const
		{
			os << "old=" << m_Old_s << "s new=" << m_New_s << "s";
		}

		void BatchOpened::Print(std::ostream& os) const
		{
			os << "batch=" << m_Batch;
		}

		void BatchClosed::Print(std::ostream& os) const
		{
			os << "batch=" << m_Batch;
		}

		void SignalSubmitted::Print(std::ostream& os) const
		{
			os << "provider=" << m_Provider << " batch=" << m_Batch;
		}

		void ThresholdSet::Print(std::ostream& os) const
		{
			os << "batch=" << m_Batch << " handle=" << m_Handle;
		}

		void DecryptionRequested::Print(std::ostream& os) const
		{
			os << "request=" << m_Request << " batch=" << m_Batch;
		}

		void DecryptionCompleted::Print(std::ostream& os) const
		{
			os << "request=" << m_Request
				<< " batch=" << m_Batch
				<< " last_signal=" << m_LastSignal
				<< " threshold=" << m_Threshold
				<< " trigger=" << m_Trigger;
		}

	} // namespace Event

	std::ostream& operator << (std::ostream& os, const Event::Base& evt)
	{
		os << Event::Type::get_Name(evt.get_Type()) << " ";
		evt.Print(os);
		return os;
	}

	void EventLog::Append(Event::Base::Ptr&& p)
	{
		assert(p);
		m_vEvents.push_back(std::move(p));
	}

} // namespace vigil
