#ifndef TITLECASE_SERVICES_HPP
#define TITLECASE_SERVICES_HPP

#include <string_view>

#include "titlecase/util/assert.hpp"
#include "titlecase/util/severity.hpp"

#include "titlecase/diagnostic.hpp"
#include "titlecase/fwd.hpp"

namespace titlecase {

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    constexpr virtual ~Logger() = default;

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        TITLECASE_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Emits `diagnostic` if its severity is at least the minimum severity.
    void log(Severity severity, std::u8string_view id, std::u8string_view message)
    {
        if (can_log(severity)) {
            (*this)(Diagnostic { .severity = severity, .id = id, .message = message });
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace titlecase

#endif
