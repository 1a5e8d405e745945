#include "strongbox/log/Registry.hpp"

#include <cstdlib>
#include <mutex>
#include <optional>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace strongbox::log
{
namespace
{

std::mutex& registryMutex()
{
    static std::mutex mutex{};
    return mutex;
}

std::optional<spdlog::level::level_enum>& levelOverride()
{
    static std::optional<spdlog::level::level_enum> level{};
    return level;
}

[[nodiscard]] spdlog::level::level_enum configuredLevel()
{
    if (levelOverride().has_value())
    {
        return *levelOverride();
    }
    const char* env{ std::getenv("SBX_LOG_LEVEL") };
    if (env == nullptr || *env == '\0')
    {
        return spdlog::level::info;
    }
    return spdlog::level::from_str(env);
}

[[nodiscard]] std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> sharedSink()
{
    static auto sink{ std::make_shared<spdlog::sinks::stderr_color_sink_mt>() };
    return sink;
}

} // namespace

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name)
{
    const std::scoped_lock lock{ registryMutex() };
    if (auto existing{ spdlog::get(name) }; existing)
    {
        return existing;
    }

    auto logger{ std::make_shared<spdlog::logger>(name, sharedSink()) };
    logger->set_pattern(g_kLogFormat);
    logger->set_level(configuredLevel());
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

void Registry::setLevel(spdlog::level::level_enum level)
{
    const std::scoped_lock lock{ registryMutex() };
    levelOverride() = level;
    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) { logger->set_level(level); });
}

} // namespace strongbox::log
