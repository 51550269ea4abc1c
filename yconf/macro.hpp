/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-12

Description: Source location macros shared by the throw helpers

**************************************************/

#ifndef YCONF_MACRO_HPP
#define YCONF_MACRO_HPP

#define YCONF_FILE_NAME __FILE__
#define YCONF_FILE_LINE __LINE__
#define YCONF_FUNC_NAME __func__

#endif  // YCONF_MACRO_HPP
