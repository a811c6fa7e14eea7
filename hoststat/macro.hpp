/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-1-10

Description: Common macros shared by every hoststat module

**************************************************/

#ifndef HOSTSTAT_MACRO_HPP
#define HOSTSTAT_MACRO_HPP

#define HOSTSTAT_FILE_NAME __FILE__
#define HOSTSTAT_FILE_LINE __LINE__
#define HOSTSTAT_FUNC_NAME __func__

#endif  // HOSTSTAT_MACRO_HPP
