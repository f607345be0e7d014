/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ECEFSEZ_HPP
#define __ECEFSEZ_HPP

#include <ecefsez/topocentric.hpp>
#include <ecefsez/config.hpp>
#include <ecefsez/cli.hpp>

#endif
