// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_UTILS_ERROR_CODES_H__
#define __ZKPERM_UTILS_ERROR_CODES_H__

#define ZKPERM_OK 0
// a field element was not in canonical form (value >= p)
#define ZKPERM_ERR_NONCANONICAL 1
// no permutation instance exists for the requested width
#define ZKPERM_ERR_WIDTH 2
// round constant counts do not match the round numbers of the instance
#define ZKPERM_ERR_ROUND_CONSTANTS 3
// unsupported (field, width, degree) parameters
#define ZKPERM_ERR_PARAMETERS 4
// any other failure (allocation, ...) caught at the C boundary
#define ZKPERM_ERR_INTERNAL 5

#endif // __ZKPERM_UTILS_ERROR_CODES_H__
