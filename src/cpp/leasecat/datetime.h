//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Real-time clock interface for lease expiry
//!
//!\details
//! Lease expiry is recorded as the number of milliseconds since the POSIX
//! epoch (1970 Jan 1, UTC), so that the persisted lease file remains
//! meaningful across restarts.  The core never reads the system clock
//! directly; it queries a `datetime::Clock` object instead.  On POSIX
//! platforms that is `util::PosixClock` (hal_posix/posix_utils.h); unit
//! tests substitute `test::MockClock` (hal_test/sim_utils.h).

#pragma once

#include <leasecat/types.h>

namespace leasecat {
    namespace datetime {
        //! Common time-related constants, measured in milliseconds.
        //!@{
        static constexpr s64 ONE_SECOND = 1000;
        static constexpr s64 ONE_MINUTE = 60 * ONE_SECOND;
        static constexpr s64 ONE_HOUR   = 60 * ONE_MINUTE;
        static constexpr s64 ONE_DAY    = 24 * ONE_HOUR;
        static constexpr s64 ONE_YEAR   = 365 * ONE_DAY;
        //!@}

        //! Abstract source of wall-clock time.
        class Clock {
        public:
            //! Current time as milliseconds since the POSIX epoch.
            virtual s64 now() const = 0;
        protected:
            ~Clock() {}
        };
    }
}
