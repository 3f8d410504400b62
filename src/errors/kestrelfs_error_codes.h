/*
   Copyright 2013-2014 EditShare
   Copyright 2013-2015 Skytechnology sp. z o.o.
   Copyright 2023-2026 Leil Storage OÜ

   This file is part of KestrelFS.

   KestrelFS is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, version 3.

   KestrelFS is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with KestrelFS. If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef __KESTRELFS_ERROR_CODES_H
#define __KESTRELFS_ERROR_CODES_H

#include <stdint.h>

enum kestrelfs_error_code {
	KESTRELFS_STATUS_OK                     =  0,    // OK
	KESTRELFS_ERROR_EPERM                   =  1,    // Operation not permitted
	KESTRELFS_ERROR_ENOTDIR                 =  2,    // Not a directory
	KESTRELFS_ERROR_ENOENT                  =  3,    // No such file or directory
	KESTRELFS_ERROR_EACCES                  =  4,    // Permission denied
	KESTRELFS_ERROR_EEXIST                  =  5,    // File exists
	KESTRELFS_ERROR_EINVAL                  =  6,    // Invalid argument
	KESTRELFS_ERROR_ENOTEMPTY               =  7,    // Directory not empty
	KESTRELFS_ERROR_LOCKED                  =  8,    // Resource locked
	KESTRELFS_ERROR_NOTDONE                 =  9,    // Requested operation not completed
	KESTRELFS_ERROR_WRONGVERSION            = 10,    // Wrong layout version
	KESTRELFS_ERROR_NOSPACE                 = 11,    // No space left
	KESTRELFS_ERROR_IO                      = 12,    // IO error
	KESTRELFS_ERROR_CANTCREATEPATH          = 13,    // Can't create path
	KESTRELFS_ERROR_MISMATCH                = 14,    // Data mismatch
	KESTRELFS_ERROR_EROFS                   = 15,    // Read-only file system
	KESTRELFS_ERROR_PARSE                   = 16,    // Parsing unsuccessful
	KESTRELFS_ERROR_METADATAVERSIONMISMATCH = 17,    // Metadata version mismatch
	KESTRELFS_ERROR_NOTPOSSIBLE             = 18,    // It's not possible to perform operation in this way
	KESTRELFS_ERROR_UNKNOWN                 = 19,    // Unknown error
	KESTRELFS_ERROR_ENAMETOOLONG            = 20,    // Name too long
	KESTRELFS_ERROR_EMLINK                  = 21,    // Too many links
	KESTRELFS_ERROR_EXDEV                   = 22,    // Cross-device link
	KESTRELFS_ERROR_MAX                     = 23
};

const char *kestrelfs_error_string(uint8_t status);

#endif
