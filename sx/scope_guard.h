// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_3180945277621956
#define SCOPE_GUARD_H_3180945277621956

#include <cassert>
#include <exception>
#include <utility>


namespace sx
{
/*  SX_ON_SCOPE_EXIT(::close(fd));              //always
    SX_ON_SCOPE_FAIL(removeFilePlain(tmpPath)); //only while an exception leaves the scope

    the action must not throw while unwinding: such an exception is dropped (debug: assert)  */

namespace impl
{
template <bool onFailOnly, class F>
class ScopeGuard
{
public:
    explicit ScopeGuard(F&& fun) : fun_(std::move(fun)) {}

    ~ScopeGuard() noexcept(onFailOnly)
    {
        const bool unwinding = std::uncaught_exceptions() > exceptionCount_;
        if (!unwinding)
        {
            if constexpr (!onFailOnly)
                fun_(); //throw X
        }
        else
            try { fun_(); }
            catch (...) { assert(false); }
    }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
};


template <bool onFailOnly, class F> inline
ScopeGuard<onFailOnly, F> makeScopeGuard(F&& fun) { return ScopeGuard<onFailOnly, F>(std::move(fun)); } //no copy: C++17 guaranteed elision
}
}

#define SX_CONCAT_SUB(X, Y) X ## Y
#define SX_CONCAT(X, Y) SX_CONCAT_SUB(X, Y)

#define SX_ON_SCOPE_EXIT(X) [[maybe_unused]] auto SX_CONCAT(scopeGuard, __LINE__) = sx::impl::makeScopeGuard<false>([&]{ X; });
#define SX_ON_SCOPE_FAIL(X) [[maybe_unused]] auto SX_CONCAT(scopeGuard, __LINE__) = sx::impl::makeScopeGuard<true >([&]{ X; });

#endif //SCOPE_GUARD_H_3180945277621956
