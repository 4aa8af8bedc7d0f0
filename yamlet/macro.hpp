/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Source location helpers shared by the throw macros

**************************************************/

#ifndef YAMLET_MACRO_HPP
#define YAMLET_MACRO_HPP

#define YAMLET_FILE_NAME __FILE__
#define YAMLET_FILE_LINE __LINE__

#if defined(__GNUC__) || defined(__clang__)
#define YAMLET_FUNC_NAME __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#define YAMLET_FUNC_NAME __FUNCSIG__
#else
#define YAMLET_FUNC_NAME __func__
#endif

#endif  // YAMLET_MACRO_HPP
