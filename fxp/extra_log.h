// *****************************************************************************
// * This file is part of the FxpCore project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_8305917264038152947
#define EXTRA_LOG_H_8305917264038152947

#include <new>
#include "error_log.h"
#include "thread.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors in destructors                       */

namespace fxp
{
namespace impl
{
inline Protected<ErrorLog>& refExtraLog()
{
    static Protected<ErrorLog> extraLog; //thread-safe init
    return extraLog;
}
}


inline
ErrorLog fetchExtraLog()
{
    return impl::refExtraLog().access([](ErrorLog& log) { return std::exchange(log, ErrorLog()); });
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    try
    {
        impl::refExtraLog().access([&](ErrorLog& log) { logMsg(log, msg, MSG_TYPE_ERROR); });
    }
    catch (const std::bad_alloc&) { assert(false); }
}
}

#endif //EXTRA_LOG_H_8305917264038152947
