/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_COMMON_ERROR_H
#define BYTECMP_COMMON_ERROR_H

#define Err_Unset -1
#define Err_Success 0
#define Err_Fail 1
#define Err_Canceled 2

// 10000
#define Err_Usage_arg_count 10000
#define Err_Usage_bad_offset 10001

// 11000
#define Err_File_permission 11001
#define Err_File_disk_full 11002
#define Err_File_permission_or_not_exists 11004
#define Err_File_open_error 11009
#define Err_File_seek_error 11010
#define Err_File_read_error 11011

#endif  // BYTECMP_COMMON_ERROR_H
