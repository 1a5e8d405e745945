#ifndef INCLUDE_STRONGBOX_LOG_REGISTRY_HPP
#define INCLUDE_STRONGBOX_LOG_REGISTRY_HPP

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace strongbox::log
{

// Named subsystem loggers sharing one colored stderr sink.
// Level comes from SBX_LOG_LEVEL (trace, debug, info, warn, error, critical, off); default is info.
class Registry final
{
public:
    [[nodiscard]] static std::shared_ptr<spdlog::logger> get(const std::string& name);

    [[nodiscard]] static std::shared_ptr<spdlog::logger> snapshot()
    {
        return get("snapshot");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> client()
    {
        return get("client");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> crypto()
    {
        return get("crypto");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> cli()
    {
        return get("cli");
    }

    // Applies to every logger created so far and to the ones created later.
    static void setLevel(spdlog::level::level_enum level);

private:
    static constexpr const char* g_kLogFormat{ "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v" };
};

} // namespace strongbox::log

#endif // INCLUDE_STRONGBOX_LOG_REGISTRY_HPP
