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
#include "events.h"
#include "errors.h"
#include "../core/hash.h"
#include <set>

namespace vigil
{
	class Config;

	// Encrypted inactivity monitor for a single subject.
	//
	// Keeps an encrypted "last activity" aggregate and an encrypted threshold, and answers
	// "inactive longer than the threshold?" through a decryption oracle, without ever holding cleartexts.
	//
	// Every public mutating method is a transaction: it either completes, or throws vigil::Exception
	// (or the adapter's/oracle's exception) leaving state and event log untouched.
	// Calls are expected to be serialized by the host.
	class Monitor
	{
	public:

		static const uint32_t s_iDecryptionCallback = 1;
		static const Timestamp s_DefaultCooldown_s = 60;

		struct Settings
		{
			Identity m_Owner;
			Identity m_Self; // contract identity, bound into every decryption request
			Timestamp m_Cooldown_s = s_DefaultCooldown_s;
			bool m_Paused = false;

			// reads monitor.cooldown_s, monitor.paused
			void Load(const Config&);
		};

		struct DecryptionContext
		{
			BatchID m_Batch = 0;
			Hash::Value m_StateHash;
			bool m_Processed = false;
		};

		struct Decision
		{
			RequestID m_Request = 0;
			BatchID m_Batch = 0;
			Timestamp m_LastSignal = 0;
			uint64_t m_Threshold = 0;
			bool m_Trigger = false;
		};

		// the committed ciphertext set, in protocol order
		struct CiphertextSet
		{
			static const uint32_t s_Count = 3;

			struct Index {
				static const uint32_t LastSignal = 0;
				static const uint32_t Threshold = 1;
				static const uint32_t Trigger = 2;
			};

			Fhe::Handle m_pHandle[s_Count];

			// binding hash over the ordered handles and the contract identity
			void get_Hash(Hash::Value&, const Identity& self) const;
		};

		Monitor(const Settings&, Fhe::IAdapter&, Fhe::IDecryptionOracle&);

		// Access control & config. Owner only
		void TransferOwnership(const Context&, const Identity& newOwner);
		void AddProvider(const Context&, const Identity&);
		void RemoveProvider(const Context&, const Identity&);
		void SetPaused(const Context&, bool);
		void SetCooldown(const Context&, Timestamp cooldown_s);

		// Batch lifecycle. Owner only, while unpaused
		void OpenNewBatch(const Context&);
		void CloseCurrentBatch(const Context&);

		// Life-signal aggregation
		void SubmitLifeSignal(const Context&, const Fhe::ExternalInput&);
		void SetInactivityThreshold(const Context&, const Fhe::ExternalInput&);

		// Decryption protocol
		RequestID CheckInheritanceTrigger(const Context&);
		Decision OnDecryptionResult(const Context&, RequestID, const Blob& cleartexts, const Blob& proof);

		// Queries
		const Identity& get_Owner() const { return m_State.m_Owner; }
		const Identity& get_Self() const { return m_Self; }
		bool IsProvider(const Identity& id) const { return m_State.m_Providers.count(id) > 0; }
		bool IsPaused() const { return m_State.m_Paused; }
		Timestamp get_Cooldown() const { return m_State.m_Cooldown_s; }
		BatchID get_CurrentBatch() const { return m_State.m_CurrentBatch; }
		bool IsBatchClosed(BatchID) const;
		bool IsAvailable() const;
		Timestamp get_LastSubmission(const Identity&) const;
		Timestamp get_LastDecryptionRequest(const Identity&) const;
		const DecryptionContext* FindDecryption(RequestID) const;
		// opaque handles only. Zero if not initialized
		Fhe::Handle get_LastSignalHandle() const;
		Fhe::Handle get_ThresholdHandle() const;

		const EventLog& get_Events() const { return m_Events; }

	private:

		typedef std::map<Identity, Timestamp> TimeMap;

		struct State
		{
			Identity m_Owner;
			std::set<Identity> m_Providers;
			bool m_Paused = false;
			Timestamp m_Cooldown_s = 0;

			TimeMap m_LastSubmission;
			TimeMap m_LastDecryptionRequest;

			BatchID m_CurrentBatch = 1;
			std::map<BatchID, bool> m_Closed;

			Fhe::Ciphertext m_LastSignal;
			Fhe::Ciphertext m_Threshold;

			std::map<RequestID, DecryptionContext> m_Decryptions;
		};

		// working copy of the state plus the events it emitted, committed only on success
		struct Tx
		{
			State m_State;
			std::vector<Event::Base::Ptr> m_vEvents;

			Tx(const State& s) :m_State(s) {}

			template <typename T>
			T& Emit()
			{
				m_vEvents.push_back(std::make_unique<T>());
				return static_cast<T&>(*m_vEvents.back());
			}
		};

		template <typename TFunc>
		void Invoke(const char* szMethod, const Context&, TFunc&&);

		static void TestOwner(const State&, const Context&);
		static void TestNotPaused(const State&);
		static void TestBatchOpen(const State&);
		static void TestCooldown(const TimeMap&, const Context&, Timestamp cooldown_s);
		static Timestamp get_Time(const TimeMap&, const Identity&);

		// returns the trigger, the caller owns its reference
		Fhe::EncryptedBool BuildCiphertextSet(const State&, Timestamp now, CiphertextSet&);
		static bool DecodeCleartexts(const Blob&, Decision&);

		Fhe::IAdapter& m_Adapter;
		Fhe::IDecryptionOracle& m_Oracle;
		const Identity m_Self;

		State m_State;
		EventLog m_Events;
	};

} // namespace vigil
