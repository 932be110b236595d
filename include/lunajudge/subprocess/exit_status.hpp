#pragma once

#include <lunajudge/common/formatters.hpp>
#include <lunajudge/common/linux.hpp>

#include <fmt/format.h>

#include <signal.h>

namespace lunajudge {

/// How a reaped process ended
class ExitStatus
{
public:
    enum class Kind { Exited, Killed, CoreDumped };

    static ExitStatus make_exited(int code);
    static ExitStatus make_killed(int signal_num);
    static ExitStatus make_core_dumped(int signal_num);

    /// From the result of a waitid(2) call that reported a terminated child
    static ExitStatus from_siginfo(const siginfo_t& info);

    Kind get_kind() const;

    /// Exit code for Exited, signal number otherwise
    int get_code() const;

    bool operator==(const ExitStatus& rhs) const = default;

private:
    ExitStatus(Kind kind, int code);

    Kind kind_;
    int code_;
};

} // namespace lunajudge

LUNAJUDGE_FORMAT_ENUM(lunajudge::ExitStatus::Kind, Exited, Killed, CoreDumped);

template <>
struct fmt::formatter<::lunajudge::ExitStatus> : ::lunajudge::DebugFormatter
{
    template <typename FormatContext>
    auto format(const ::lunajudge::ExitStatus& from, FormatContext& ctx) const {
        switch (from.get_kind()) {
        case ::lunajudge::ExitStatus::Kind::Exited:
            return fmt::format_to(ctx.out(), "exited with code {}", from.get_code());
        case ::lunajudge::ExitStatus::Kind::Killed:
            return fmt::format_to(ctx.out(), "killed by signal {} ({})", from.get_code(),
                                  ::lunajudge::linux::signal_description(from.get_code()));
        case ::lunajudge::ExitStatus::Kind::CoreDumped:
            return fmt::format_to(ctx.out(), "dumped core on signal {} ({})", from.get_code(),
                                  ::lunajudge::linux::signal_description(from.get_code()));
        }

        return fmt::format_to(ctx.out(), "<unknown exit status>");
    }
};
