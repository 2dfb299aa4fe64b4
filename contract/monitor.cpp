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

#include "monitor.h"
#include "../utility/config.h"
#include "../utility/logger.h"

namespace vigil
{
	void Monitor::Settings::Load(const Config& cfg)
	{
		if (cfg.has_key("monitor.cooldown_s"))
		{
			Config::Int val = cfg.get<Config::Int>("monitor.cooldown_s", -1);
			if (val < 0)
				throw std::runtime_error("monitor.cooldown_s must be a non-negative integer");
			m_Cooldown_s = static_cast<Timestamp>(val);
		}

		m_Paused = cfg.get_bool("monitor.paused", m_Paused);
	}

	Monitor::Monitor(const Settings& stg, Fhe::IAdapter& a, Fhe::IDecryptionOracle& o)
		:m_Adapter(a)
		,m_Oracle(o)
		,m_Self(stg.m_Self)
	{
		m_State.m_Owner = stg.m_Owner;
		m_State.m_Providers.insert(stg.m_Owner);
		m_State.m_Paused = stg.m_Paused;
		m_State.m_Cooldown_s = stg.m_Cooldown_s;
		m_State.m_CurrentBatch = 1;
		m_State.m_Closed[1] = false;

		LOG_INFO() << "Monitor " << m_Self << " created, owner=" << stg.m_Owner << TRACE(stg.m_Cooldown_s) << TRACE(stg.m_Paused);
	}

	template <typename TFunc>
	void Monitor::Invoke(const char* szMethod, const Context& ctx, TFunc&& func)
	{
		Tx tx(m_State);

		try
		{
			func(tx);
		}
		catch (const Exception& e)
		{
			LOG_WARNING() << szMethod << " rejected: " << error_str(e.errorCode) << ", caller=" << ctx.m_Caller << " now=" << ctx.m_Now;
			throw;
		}
		catch (const std::exception& e)
		{
			LOG_WARNING() << szMethod << " failed: " << e.what() << ", caller=" << ctx.m_Caller;
			throw;
		}

		m_State = std::move(tx.m_State);

		for (auto& pEvt : tx.m_vEvents)
		{
			LOG_INFO() << szMethod << ": " << *pEvt;
			m_Events.Append(std::move(pEvt));
		}
	}

	/////////////////////
	// Preconditions
	void Monitor::TestOwner(const State& s, const Context& ctx)
	{
		VIGIL_EXCEPTION_IF(ctx.m_Caller != s.m_Owner, NotOwner);
	}

	void Monitor::TestNotPaused(const State& s)
	{
		VIGIL_EXCEPTION_IF(s.m_Paused, Paused);
	}

	void Monitor::TestBatchOpen(const State& s)
	{
		auto it = s.m_Closed.find(s.m_CurrentBatch);
		VIGIL_EXCEPTION_IF((s.m_Closed.end() != it) && it->second, BatchClosedOrInvalid);
	}

	Timestamp Monitor::get_Time(const TimeMap& m, const Identity& id)
	{
		auto it = m.find(id);
		return (m.end() == it) ? 0 : it->second;
	}

	void Monitor::TestCooldown(const TimeMap& m, const Context& ctx, Timestamp cooldown_s)
	{
		// now >= last + cooldown, without overflow
		Timestamp tLast = get_Time(m, ctx.m_Caller);
		VIGIL_EXCEPTION_IF((ctx.m_Now < tLast) || (ctx.m_Now - tLast < cooldown_s), CooldownActive);
	}

	/////////////////////
	// Access control & config
	void Monitor::TransferOwnership(const Context& ctx, const Identity& newOwner)
	{
		Invoke("TransferOwnership", ctx, [&](Tx& tx) {
			TestOwner(tx.m_State, ctx);

			auto& evt = tx.Emit<Event::OwnershipTransferred>();
			evt.m_Prev = tx.m_State.m_Owner;
			evt.m_New = newOwner;

			tx.m_State.m_Owner = newOwner;
		});
	}

	void Monitor::AddProvider(const Context& ctx, const Identity& id)
	{
		Invoke("AddProvider", ctx, [&](Tx& tx) {
			TestOwner(tx.m_State, ctx);

			if (!tx.m_State.m_Providers.insert(id).second)
				return; // already there

			tx.Emit<Event::ProviderAdded>().m_Provider = id;
		});
	}

	void Monitor::RemoveProvider(const Context& ctx, const Identity& id)
	{
		Invoke("RemoveProvider", ctx, [&](Tx& tx) {
			TestOwner(tx.m_State, ctx);

			if (!tx.m_State.m_Providers.erase(id))
				return;

			tx.Emit<Event::ProviderRemoved>().m_Provider = id;
		});
	}

	void Monitor::SetPaused(const Context& ctx, bool bPaused)
	{
		Invoke("SetPaused", ctx, [&](Tx& tx) {
			TestOwner(tx.m_State, ctx);

			tx.m_State.m_Paused = bPaused;
			tx.Emit<Event::PausedToggled>().m_Paused = bPaused;
		});
	}

	void Monitor::SetCooldown(const Context& ctx, Timestamp cooldown_s)
	{
		Invoke("SetCooldown", ctx, [&](Tx& tx) {
			TestOwner(tx.m_State, ctx);

			auto& evt = tx.Emit<Event::CooldownUpdated>();
			evt.m_Old_s = tx.m_State.m_Cooldown_s;
			evt.m_New_s = cooldown_s;

			tx.m_State.m_Cooldown_s = cooldown_s;
		});
	}

	/////////////////////
	// Batch lifecycle
	void Monitor::OpenNewBatch(const Context& ctx)
	{
		Invoke("OpenNewBatch", ctx, [&](Tx& tx) {
			State& s = tx.m_State;
			TestOwner(s, ctx);
			TestNotPaused(s);

			s.m_CurrentBatch++;
			s.m_Closed[s.m_CurrentBatch] = false;

			tx.Emit<Event::BatchOpened>().m_Batch = s.m_CurrentBatch;
		});
	}

	void Monitor::CloseCurrentBatch(const Context& ctx)
	{
		Invoke("CloseCurrentBatch", ctx, [&](Tx& tx) {
			State& s = tx.m_State;
			TestOwner(s, ctx);
			TestNotPaused(s);

			s.m_Closed[s.m_CurrentBatch] = true;

			tx.Emit<Event::BatchClosed>().m_Batch = s.m_CurrentBatch;
		});
	}

	/////////////////////
	// Life-signal aggregation
	void Monitor::SubmitLifeSignal(const Context& ctx, const Fhe::ExternalInput& inp)
	{
		Invoke("SubmitLifeSignal", ctx, [&](Tx& tx) {
			State& s = tx.m_State;
			VIGIL_EXCEPTION_IF(!s.m_Providers.count(ctx.m_Caller), NotProvider);
			TestNotPaused(s);
			TestCooldown(s.m_LastSubmission, ctx, s.m_Cooldown_s);
			TestBatchOpen(s);

			s.m_LastSubmission[ctx.m_Caller] = ctx.m_Now;

			Fhe::Ciphertext val = m_Adapter.Wrap(inp);
			VIGIL_EXCEPTION_IF(!m_Adapter.IsInitialized(val), InvalidSignal);

			// max is the order-independent, idempotent reducer for "latest activity seen"
			if (m_Adapter.IsInitialized(s.m_LastSignal))
			{
				s.m_LastSignal = m_Adapter.Max(s.m_LastSignal, val);
				m_Adapter.Release(val);
			}
			else
				s.m_LastSignal = val;

			LOG_DEBUG() << "Aggregate handle " << s.m_LastSignal.m_Handle;

			auto& evt = tx.Emit<Event::SignalSubmitted>();
			evt.m_Provider = ctx.m_Caller;
			evt.m_Batch = s.m_CurrentBatch;
		});
	}

	void Monitor::SetInactivityThreshold(const Context& ctx, const Fhe::ExternalInput& inp)
	{
		Invoke("SetInactivityThreshold", ctx, [&](Tx& tx) {
			State& s = tx.m_State;
			TestOwner(s, ctx);
			TestNotPaused(s);

			Fhe::Ciphertext val = m_Adapter.Wrap(inp);
			VIGIL_EXCEPTION_IF(!m_Adapter.IsInitialized(val), InvalidThreshold);

			s.m_Threshold = val;

			auto& evt = tx.Emit<Event::ThresholdSet>();
			evt.m_Batch = s.m_CurrentBatch;
			evt.m_Handle = m_Adapter.SerializeHandle(val);
		});
	}

	/////////////////////
	// Decryption protocol
	void Monitor::CiphertextSet::get_Hash(Hash::Value& hv, const Identity& self) const
	{
		Hash::Processor hp;
		for (uint32_t i = 0; i < s_Count; i++)
			hp << m_pHandle[i];

		hp
			<< self
			>> hv;
	}

	Fhe::EncryptedBool Monitor::BuildCiphertextSet(const State& s, Timestamp now, CiphertextSet& cs)
	{
		Fhe::Ciphertext ctNow = m_Adapter.Wrap(now);
		Fhe::Ciphertext elapsed = m_Adapter.Sub(ctNow, s.m_LastSignal);
		Fhe::EncryptedBool trigger = m_Adapter.CompareGE(elapsed, s.m_Threshold);

		m_Adapter.Release(elapsed);
		m_Adapter.Release(ctNow);

		cs.m_pHandle[CiphertextSet::Index::LastSignal] = m_Adapter.SerializeHandle(s.m_LastSignal);
		cs.m_pHandle[CiphertextSet::Index::Threshold] = m_Adapter.SerializeHandle(s.m_Threshold);
		cs.m_pHandle[CiphertextSet::Index::Trigger] = m_Adapter.SerializeHandle(trigger);

		return trigger;
	}

	bool Monitor::DecodeCleartexts(const Blob& cleartexts, Decision& d)
	{
		if (Fhe::Cleartext::get_Count(cleartexts) != CiphertextSet::s_Count)
			return false;

		uint64_t nTrigger = 0;
		if (!Fhe::Cleartext::Read(cleartexts, CiphertextSet::Index::LastSignal, d.m_LastSignal) ||
			!Fhe::Cleartext::Read(cleartexts, CiphertextSet::Index::Threshold, d.m_Threshold) ||
			!Fhe::Cleartext::Read(cleartexts, CiphertextSet::Index::Trigger, nTrigger))
			return false;

		d.m_Trigger = (0 != nTrigger);
		return true;
	}

	RequestID Monitor::CheckInheritanceTrigger(const Context& ctx)
	{
		RequestID res = 0;

		Invoke("CheckInheritanceTrigger", ctx, [&](Tx& tx) {
			State& s = tx.m_State;
			VIGIL_EXCEPTION_IF(!m_Adapter.IsInitialized(s.m_LastSignal) || !m_Adapter.IsInitialized(s.m_Threshold), InvalidThreshold);
			TestNotPaused(s);
			TestCooldown(s.m_LastDecryptionRequest, ctx, s.m_Cooldown_s);
			TestBatchOpen(s);

			s.m_LastDecryptionRequest[ctx.m_Caller] = ctx.m_Now;

			// the trigger stays with the adapter until the request completes
			CiphertextSet cs;
			BuildCiphertextSet(s, ctx.m_Now, cs);

			DecryptionContext dc;
			dc.m_Batch = s.m_CurrentBatch;
			cs.get_Hash(dc.m_StateHash, m_Self);

			// The request leaves the monitor here and can't be withdrawn, so nothing that may fail is left after it
			// except the id check. If that fails the oracle keeps an orphan request, and its answer is refused
			// since no context is committed for it.
			std::vector<Fhe::Handle> vHandles(cs.m_pHandle, cs.m_pHandle + CiphertextSet::s_Count);
			res = m_Oracle.SubmitDecryptionRequest(vHandles, s_iDecryptionCallback);

			// one context per request id, ever
			if (s.m_Decryptions.count(res))
			{
				LOG_ERROR() << "Oracle reused request id " << res;
				VIGIL_EXCEPTION(ReplayDetected);
			}
			s.m_Decryptions[res] = dc;

			LOG_DEBUG() << "Request " << res << " state hash " << dc.m_StateHash;

			auto& evt = tx.Emit<Event::DecryptionRequested>();
			evt.m_Request = res;
			evt.m_Batch = dc.m_Batch;
		});

		return res;
	}

	Monitor::Decision Monitor::OnDecryptionResult(const Context& ctx, RequestID id, const Blob& cleartexts, const Blob& proof)
	{
		Decision res;

		Invoke("OnDecryptionResult", ctx, [&](Tx& tx) {
			State& s = tx.m_State;

			auto it = s.m_Decryptions.find(id);
			VIGIL_EXCEPTION_IF((s.m_Decryptions.end() != it) && it->second.m_Processed, ReplayDetected);
			// unknown request has no committed hash to match
			VIGIL_EXCEPTION_IF(s.m_Decryptions.end() == it, StateMismatch);

			DecryptionContext& dc = it->second;

			// re-derive from live state, never from the caller's data
			CiphertextSet cs;
			Fhe::EncryptedBool trigger = BuildCiphertextSet(s, ctx.m_Now, cs);

			Hash::Value hv;
			cs.get_Hash(hv, m_Self);
			m_Adapter.Release(trigger);

			if (hv != dc.m_StateHash)
			{
				LOG_DEBUG() << "Request " << id << " expected " << dc.m_StateHash << ", live " << hv;
				VIGIL_EXCEPTION(StateMismatch);
			}

			VIGIL_EXCEPTION_IF(!m_Oracle.VerifyProof(id, cleartexts, proof), DecryptionFailed);

			res.m_Request = id;
			res.m_Batch = dc.m_Batch;
			VIGIL_EXCEPTION_IF(!DecodeCleartexts(cleartexts, res), DecryptionFailed);

			dc.m_Processed = true;
			m_Adapter.Release(trigger); // the reference taken by the request

			auto& evt = tx.Emit<Event::DecryptionCompleted>();
			evt.m_Request = res.m_Request;
			evt.m_Batch = res.m_Batch;
			evt.m_LastSignal = res.m_LastSignal;
			evt.m_Threshold = res.m_Threshold;
			evt.m_Trigger = res.m_Trigger;
		});

		return res;
	}

	/////////////////////
	// Queries
	bool Monitor::IsBatchClosed(BatchID id) const
	{
		auto it = m_State.m_Closed.find(id);
		return (m_State.m_Closed.end() != it) && it->second;
	}

	bool Monitor::IsAvailable() const
	{
		return !m_State.m_Paused && !IsBatchClosed(m_State.m_CurrentBatch);
	}

	Timestamp Monitor::get_LastSubmission(const Identity& id) const
	{
		return get_Time(m_State.m_LastSubmission, id);
	}

	Timestamp Monitor::get_LastDecryptionRequest(const Identity& id) const
	{
		return get_Time(m_State.m_LastDecryptionRequest, id);
	}

	const Monitor::DecryptionContext* Monitor::FindDecryption(RequestID id) const
	{
		auto it = m_State.m_Decryptions.find(id);
		return (m_State.m_Decryptions.end() == it) ? nullptr : &it->second;
	}

	Fhe::Handle Monitor::get_LastSignalHandle() const
	{
		if (!m_Adapter.IsInitialized(m_State.m_LastSignal))
			return Zero;
		return m_Adapter.SerializeHandle(m_State.m_LastSignal);
	}

	Fhe::Handle Monitor::get_ThresholdHandle() const
	{
		if (!m_Adapter.IsInitialized(m_State.m_Threshold))
			return Zero;
		return m_Adapter.SerializeHandle(m_State.m_Threshold);
	}

} // namespace vigil
