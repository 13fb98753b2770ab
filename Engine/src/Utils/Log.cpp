#include "Log.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"

#define VU_EngineName "vu"
#define VU_AppName "App"

namespace vu
{
	std::shared_ptr<spdlog::logger> CLog::S_EngineLogger;
	std::shared_ptr<spdlog::logger> CLog::S_ClientLogger;

	namespace
	{
		const char* S_Pattern = "[%H:%M:%S %z] [%n] [%^---%L---%$] [thread %t] %v";

		std::shared_ptr<spdlog::logger> makeConsoleLogger(const char* name)
		{
			auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
			auto logger = std::make_shared<spdlog::logger>( name, spdlog::sinks_init_list { console_sink } );
			logger->set_pattern( S_Pattern );
			logger->set_level( spdlog::level::trace );
			return logger;
		}
	}

	void CLog::Init(const std::string& log_file)
	{
		spdlog::set_pattern( S_Pattern );
		auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

		S_EngineLogger = std::make_shared<spdlog::logger>( VU_EngineName, spdlog::sinks_init_list { console_sink } );
		S_EngineLogger->set_level( spdlog::level::trace );

		// initialize the client logger
		S_ClientLogger = std::make_shared<spdlog::logger>( VU_AppName, spdlog::sinks_init_list { console_sink } );
		S_ClientLogger->set_level( spdlog::level::trace );

		// make it output to file
		if (!log_file.empty())
		{
			auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>( log_file, true );
			S_EngineLogger->sinks().push_back( file_sink );
			S_ClientLogger->sinks().push_back( file_sink );
		}
	}

	void CLog::Shutdown()
	{
		if (S_EngineLogger)
		{
			VU_LOG_TRACE( "Destroying Log" );
			S_EngineLogger->flush();
		}
		if (S_ClientLogger)
		{
			S_ClientLogger->flush();
		}

		spdlog::drop_all();
		S_EngineLogger.reset();
		S_ClientLogger.reset();
	}

	// Loggers are created on first use when Init has not run yet, console only.
	std::shared_ptr<spdlog::logger>& CLog::GetEngineLogger()
	{
		if (!S_EngineLogger)
		{
			S_EngineLogger = makeConsoleLogger( VU_EngineName );
		}
		return S_EngineLogger;
	}

	std::shared_ptr<spdlog::logger>& CLog::GetClientLogger()
	{
		if (!S_ClientLogger)
		{
			S_ClientLogger = makeConsoleLogger( VU_AppName );
		}
		return S_ClientLogger;
	}
}
