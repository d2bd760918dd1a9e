// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_5820194736120398475
#define SCOPE_GUARD_H_5820194736120398475

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


namespace fxp
{
/*  Scope Guard

        auto guardHandle = fxp::makeGuard<ScopeGuardRunMode::onFail>([&] { ::curl_easy_cleanup(easyHandle); });
            ...
        guardHandle.dismiss();

    Scope Exit:
        FXP_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        FXP_ON_SCOPE_FAIL(session.disconnect());                 */

enum class ScopeGuardRunMode
{
    onExit,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(std::exchange(tmp.dismissed_, true)) {}

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (dismissed_)
            return;

        const bool failed = std::uncaught_exceptions() > exceptionCount_;

        if constexpr (runMode == ScopeGuardRunMode::onExit)
        {
            if (!failed)
                fun_(); //throw X
            else
                try { fun_(); }
                catch (...) { assert(false); } //cleanup must not throw while another exception is in flight
        }
        else if (failed)
            try { fun_(); }
            catch (...) { assert(false); }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::decay_t<F>(std::forward<F>(fun))); }
}

#define FXP_CONCAT_SUB(X, Y) X ## Y
#define FXP_CONCAT(X, Y) FXP_CONCAT_SUB(X, Y)

#define FXP_CHECK_CASE_FOR_CONSTANT(X) case X: return FXP_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define FXP_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X

#define FXP_ON_SCOPE_EXIT(X) [[maybe_unused]] auto FXP_CONCAT(scopeGuard, __LINE__) = fxp::makeGuard<fxp::ScopeGuardRunMode::onExit>([&]{ X; });
#define FXP_ON_SCOPE_FAIL(X) [[maybe_unused]] auto FXP_CONCAT(scopeGuard, __LINE__) = fxp::makeGuard<fxp::ScopeGuardRunMode::onFail>([&]{ X; });

#endif //SCOPE_GUARD_H_5820194736120398475
