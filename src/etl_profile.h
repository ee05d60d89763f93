#ifndef __ETL_PROFILE_H__
#define __ETL_PROFILE_H__

// DMXUSB widget library - ETL deterministic profile.
// No heap usage, no exceptions and no RTTI on the MCU.

#define ETL_NO_EXCEPTIONS
#define ETL_NO_RTTI
#define ETL_LOG_ERRORS
#define ETL_VERBOSE_ERRORS
#define ETL_CHECK_PUSH_POP

// AVR toolchains ship without a usable libstdc++.
#if defined(__AVR__)
  #define ETL_NO_STL
#endif

#endif
