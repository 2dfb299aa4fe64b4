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
#include "common.h"

namespace vigil
{
#define VigilEventsAll(macro) \
	macro(OwnershipTransferred) \
	macro(ProviderAdded) \
	macro(ProviderRemoved) \
	macro(PausedToggled) \
	macro(CooldownUpdated) \
	macro(BatchOpened) \
	macro(BatchClosed) \
	macro(SignalSubmitted) \
	macro(ThresholdSet) \
	macro(DecryptionRequested) \
	macro(DecryptionCompleted)

	namespace Event
	{
		struct Type
		{
			enum Enum {
#define THE_MACRO(name) name,
				VigilEventsAll(THE_MACRO)
#undef THE_MACRO
			};

			static const char* get_Name(Enum);
		};

		struct Base
		{
			typedef std::unique_ptr<Base> Ptr;

			virtual ~Base() = default;
			virtual Type::Enum get_Type() const = 0;
			virtual void Print(std::ostream&) const = 0;
		};

		template <Type::Enum t>
		struct Typed
			:public Base
		{
			static constexpr Type::Enum s_Type = t;
			Type::Enum get_Type() const override { return t; }
		};

		struct OwnershipTransferred :public Typed<Type::OwnershipTransferred> {
			Identity m_Prev;
			Identity m_New;
			void Print(std::ostream&) const override;
		};

		struct ProviderAdded :public Typed<Type::ProviderAdded> {
			Identity m_Provider;
			void Print(std::ostream&) const override;
		};

		struct ProviderRemoved :public Typed<Type::ProviderRemoved> {
			Identity m_Provider;
			void Print(std::ostream&) const override;
		};

		struct PausedToggled :public Typed<Type::PausedToggled> {
			bool m_Paused;
			void Print(std::ostream&) const override;
		};

		struct CooldownUpdated :public Typed<Type::CooldownUpdated> {
			Timestamp m_Old_s;
			Timestamp m_New_s;
			void Print(std::ostream&) const override;
		};

		struct BatchOpened :public Typed<Type::BatchOpened> {
			BatchID m_Batch;
			void Print(std::ostream&) const override;
		};

		struct BatchClosed :public Typed<Type::BatchClosed> {
			BatchID m_Batch;
			void Print(std::ostream&) const override;
		};

		// carries no ciphertext
		struct SignalSubmitted :public Typed<Type::SignalSubmitted> {
			Identity m_Provider;
			BatchID m_Batch;
			void Print(std::ostream&) const override;
		};

		struct ThresholdSet :public Typed<Type::ThresholdSet> {
			BatchID m_Batch;
			Fhe::Handle m_Handle;
			void Print(std::ostream&) const override;
		};

		struct DecryptionRequested :public Typed<Type::DecryptionRequested> {
			RequestID m_Request;
			BatchID m_Batch;
			void Print(std::ostream&) const override;
		};

		struct DecryptionCompleted :public Typed<Type::DecryptionCompleted> {
			RequestID m_Request;
			BatchID m_Batch;
			Timestamp m_LastSignal;
			uint64_t m_Threshold;
			bool m_Trigger;
			void Print(std::ostream&) const override;
		};

	} // namespace Event

	std::ostream& operator << (std::ostream&, const Event::Base&);

	// Append-only audit trail. The monitor writes it, but never reads it back
	class EventLog
	{
		std::vector<Event::Base::Ptr> m_vEvents;

	public:
		void Append(Event::Base::Ptr&&);

		size_t size() const { return m_vEvents.size(); }
		bool empty() const { return m_vEvents.empty(); }
		const Event::Base& operator [] (size_t i) const { return *m_vEvents.at(i); }

		template <typename T>
		const T* get_Last() const
		{
			for (auto it = m_vEvents.rbegin(); m_vEvents.rend() != it; ++it)
				if (T::s_Type == (*it)->get_Type())
					return static_cast<const T*>(it->get());
			return nullptr;
		}

		template <typename T>
		size_t Count() const
		{
			size_t n = 0;
			for (const auto& p : m_vEvents)
				if (T::s_Type == p->get_Type())
					n++;
			return n;
		}
	};

} // namespace vigil
