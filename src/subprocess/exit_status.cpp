#include <lunajudge/subprocess/exit_status.hpp>

#include <libassert/assert.hpp>

#include <signal.h>

namespace lunajudge {

ExitStatus::ExitStatus(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

ExitStatus ExitStatus::make_exited(int code) {
    return {Kind::Exited, code};
}

ExitStatus ExitStatus::make_killed(int signal_num) {
    return {Kind::Killed, signal_num};
}

ExitStatus ExitStatus::make_core_dumped(int signal_num) {
    return {Kind::CoreDumped, signal_num};
}

ExitStatus ExitStatus::from_siginfo(const siginfo_t& info) {
    switch (info.si_code) {
    case CLD_EXITED:
        return make_exited(info.si_status);
    case CLD_KILLED:
        return make_killed(info.si_status);
    case CLD_DUMPED:
        return make_core_dumped(info.si_status);
    default:
        UNREACHABLE("siginfo does not describe a terminated child", info.si_code);
    }
}

ExitStatus::Kind ExitStatus::get_kind() const {
    return kind_;
}

int ExitStatus::get_code() const {
    return code_;
}

} // namespace lunajudge
