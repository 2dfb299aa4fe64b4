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

#include "contract/monitor.h"
#include "core/fhe_plain.h"
#include "core/oracle_local.h"
#include "utility/config.h"
#include "utility/options.h"
#include "utility/logger.h"

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

using namespace vigil;
using namespace std;

#define FILES_PREFIX "vigil-cli"

namespace
{
	const Timestamp s_SecondsPerDay = 24 * 60 * 60;

	struct Options
	{
		int logLevel;
		int fileLogLevel;
		std::string logDir;

		Monitor::Settings m_Settings;

		std::vector<Timestamp> m_vSignals;
		uint64_t m_Threshold_s = 0;
		Timestamp m_Now = 0;
		bool m_Race = false;
		Timestamp m_RaceSignal = 0;
	};

	Identity MakeIdentity(uint8_t n)
	{
		Identity id;
		id.m_pData[0] = n;
		return id;
	}

	bool parse_cmdline(int argc, char* argv[], Options& o)
	{
		po::options_description options = createOptionsDescription(ALL_OPTIONS);

#ifdef NDEBUG
		o.logLevel = LOG_LEVEL_INFO;
#else
		o.logLevel = LOG_LEVEL_DEBUG;
#endif

		po::variables_map vm;
		try
		{
			if (!getOptions(argc, argv, options, vm))
				return false;

			o.logLevel = getLogLevel(cli::LOG_LEVEL, vm, o.logLevel);
			o.fileLogLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_SINK_DISABLED);
			o.logDir = vm[cli::LOG_DIR].as<string>();

			o.m_Settings.m_Owner = MakeIdentity(0x01);
			o.m_Settings.m_Self = MakeIdentity(0x0c);

			if (vm.count(cli::CONFIG_FILE_PATH))
			{
				Config cfg;
				cfg.load(vm[cli::CONFIG_FILE_PATH].as<string>());
				o.m_Settings.Load(cfg);
			}

			if (vm.count(cli::COOLDOWN))
				o.m_Settings.m_Cooldown_s = vm[cli::COOLDOWN].as<uint64_t>();

			if (vm.count(cli::SIGNAL))
				o.m_vSignals = vm[cli::SIGNAL].as<vector<uint64_t> >();
			else
				o.m_vSignals.push_back(1000);

			if (vm.count(cli::THRESHOLD))
				o.m_Threshold_s = vm[cli::THRESHOLD].as<uint64_t>();
			else
				o.m_Threshold_s = s_SecondsPerDay * vm[cli::THRESHOLD_DAYS].as<uint32_t>();

			if (vm.count(cli::NOW))
				o.m_Now = vm[cli::NOW].as<uint64_t>();
			else
			{
				// the earliest moment the trigger may fire
				for (Timestamp t : o.m_vSignals)
					std::setmax(o.m_Now, t);
				o.m_Now += o.m_Threshold_s;
			}

			o.m_Race = vm.count(cli::RACE_SIGNAL) > 0;
			if (o.m_Race)
				o.m_RaceSignal = vm[cli::RACE_SIGNAL].as<uint64_t>();

			return true;
		}
		catch (const po::error& ex)
		{
			cerr << ex.what() << endl;
			cout << options << endl;
		}
		catch (const exception& ex)
		{
			cerr << ex.what() << endl;
		}

		return false;
	}

	void run(const Options& o)
	{
		Fhe::PlainAdapter adapter;
		Fhe::LocalOracle oracle(adapter);
		Monitor m(o.m_Settings, adapter, oracle);

		Context ctxOwner;
		ctxOwner.m_Caller = o.m_Settings.m_Owner;

		Context ctxProvider;
		ctxProvider.m_Caller = MakeIdentity(0x02);

		m.AddProvider(ctxOwner, ctxProvider.m_Caller);

		// consecutive submissions are spaced by exactly one cooldown
		for (size_t i = 0; i < o.m_vSignals.size(); i++)
		{
			ctxProvider.m_Now = m.get_Cooldown() * (i + 1);
			m.SubmitLifeSignal(ctxProvider, adapter.Encrypt(o.m_vSignals[i]));
		}

		m.SetInactivityThreshold(ctxOwner, adapter.Encrypt(o.m_Threshold_s));

		Context ctxChecker;
		ctxChecker.m_Caller = MakeIdentity(0x03);
		ctxChecker.m_Now = o.m_Now;

		RequestID id = m.CheckInheritanceTrigger(ctxChecker);

		if (o.m_Race)
		{
			ctxProvider.m_Now = o.m_Now;
			m.SubmitLifeSignal(ctxProvider, adapter.Encrypt(o.m_RaceSignal));
		}

		Fhe::LocalOracle::Response resp;
		if (!oracle.Fulfill(id, resp))
			throw std::runtime_error("oracle lost request " + std::to_string(id));

		try
		{
			Monitor::Decision d = m.OnDecryptionResult(ctxChecker, resp.m_ID, resp.m_Cleartexts, resp.m_Proof);
			LOG_INFO() << "Decision: request=" << d.m_Request << " batch=" << d.m_Batch << " last_signal=" << d.m_LastSignal
				<< " threshold=" << d.m_Threshold << " trigger=" << (d.m_Trigger ? "yes" : "no");
		}
		catch (const Exception& e)
		{
			LOG_INFO() << "Decryption result rejected: " << error_str(e.errorCode) << " (" << error_descr(e.errorCode) << ")";
		}

		const EventLog& log = m.get_Events();
		for (size_t i = 0; i < log.size(); i++)
			LOG_INFO() << "event " << i << ": " << log[i];
	}
}

int main(int argc, char* argv[])
{
	Options options;
	if (!parse_cmdline(argc, argv, options))
		return 1;

	const auto path = boost::filesystem::system_complete(options.logDir);
	auto logger = Logger::create(LOG_LEVEL_INFO, options.logLevel, options.fileLogLevel, FILES_PREFIX, path.string());

	int retCode = 0;
	try
	{
		run(options);
	}
	catch (const Exception& e)
	{
		LOG_ERROR() << "Rejected: " << error_str(e.errorCode) << ", " << e.what();
		retCode = 2;
	}
	catch (const std::exception& e)
	{
		LOG_ERROR() << "EXCEPTION: " << e.what();
		retCode = 255;
	}

	return retCode;
}
