#pragma once

#include <memory>
#include "spdlog/spdlog.h"
#include "spdlog/fmt/ostr.h"

namespace vu
{
	class CLog
	{
	public:
		// Creates the engine and client loggers. A file sink is added when
		// log_file is not empty.
		static void Init(const std::string& log_file = "vu.log");
		static void Shutdown();

		static std::shared_ptr<spdlog::logger>& GetEngineLogger();
		static std::shared_ptr<spdlog::logger>& GetClientLogger();

	private:
		static std::shared_ptr<spdlog::logger> S_EngineLogger;
		static std::shared_ptr<spdlog::logger> S_ClientLogger;
	};
}

// Engine log macros
#define VU_LOG_TRACE( ... )    ::vu::CLog::GetEngineLogger()->trace( __VA_ARGS__ )
#define VU_LOG_INFO( ... )     ::vu::CLog::GetEngineLogger()->info( __VA_ARGS__ )
#define VU_LOG_WARN( ... )     ::vu::CLog::GetEngineLogger()->warn( __VA_ARGS__ )
#define VU_LOG_ERROR( ... )    ::vu::CLog::GetEngineLogger()->error( __VA_ARGS__ )
#define VU_LOG_FATAL( ... )    ::vu::CLog::GetEngineLogger()->critical( __VA_ARGS__ )

// Client log macros
#define VU_APP_TRACE( ... )    ::vu::CLog::GetClientLogger()->trace( __VA_ARGS__ )
#define VU_APP_INFO( ... )     ::vu::CLog::GetClientLogger()->info( __VA_ARGS__ )
#define VU_APP_WARN( ... )     ::vu::CLog::GetClientLogger()->warn( __VA_ARGS__ )
#define VU_APP_ERROR( ... )    ::vu::CLog::GetClientLogger()->error( __VA_ARGS__ )
#define VU_APP_FATAL( ... )    ::vu::CLog::GetClientLogger()->critical( __VA_ARGS__ )
